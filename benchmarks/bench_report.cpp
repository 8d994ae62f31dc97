#include <benchmark/benchmark.h>

#include <fixtures/fixtures_loader.hpp>
#include <xrayopt_core/xrayopt.hpp>

using namespace xrayopt;
using xrayopt::testing::FixturesLoader;

static void BM_OptimizeSingleStrategy(benchmark::State& state) {
  ModelOptimizer optimizer;
  auto info = FixturesLoader::resnet50_info();

  for (auto _ : state) {
    auto result = optimizer.optimize_model(info, "quantization", 10.0);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_OptimizeSingleStrategy)->Unit(benchmark::kMicrosecond);

static void BM_CompareStrategies(benchmark::State& state) {
  ModelOptimizer optimizer;
  auto infos = FixturesLoader::generate_model_infos(static_cast<size_t>(state.range(0)));

  for (auto _ : state) {
    for (const auto& info : infos) {
      auto comparison = optimizer.compare_strategies(info, 10.0);
      benchmark::DoNotOptimize(comparison);
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CompareStrategies)->Arg(1)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

static void BM_BuildReportJson(benchmark::State& state) {
  auto created = XrayOpt::from_builtin();
  if (!created.has_value()) {
    state.SkipWithError(("Failed to create engine: " + created.error()).c_str());
    return;
  }
  auto engine = std::move(created).value();

  for (auto _ : state) {
    auto report = engine.report("resnet50", 10.0);
    if (!report) {
      state.SkipWithError(report.error().c_str());
      break;
    }
    auto serialized = report->to_json_string();
    benchmark::DoNotOptimize(serialized);
  }
}
BENCHMARK(BM_BuildReportJson)->Unit(benchmark::kMicrosecond);

static void BM_BuildReportConcurrent(benchmark::State& state) {
  static const ModelOptimizer optimizer;
  auto info = FixturesLoader::resnet50_info();

  for (auto _ : state) {
    auto report = optimizer.build_report(info, 10.0);
    benchmark::DoNotOptimize(report);
  }
}
BENCHMARK(BM_BuildReportConcurrent)->Threads(1)->Threads(4)->Threads(8)->UseRealTime();

static void BM_CatalogMsgpackLoad(benchmark::State& state) {
  auto data = ModelCatalog::builtin().to_msgpack_string();

  for (auto _ : state) {
    auto catalog = ModelCatalog::from_msgpack_string(data);
    benchmark::DoNotOptimize(catalog);
  }
}
BENCHMARK(BM_CatalogMsgpackLoad)->Unit(benchmark::kMicrosecond);
