#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <xrayopt_core/strategy.hpp>

using json = nlohmann::json;

namespace xrayopt {

  namespace {

    std::int64_t scale_parameters(std::int64_t parameters, double keep) noexcept {
      return saturate_count(std::floor(static_cast<double>(parameters) * keep));
    }

    // Pruning and distillation aim at target/original; the ratio is capped but not floored, so
    // a target above the original size yields a negative ratio (the model grows).
    Result<double, std::string> size_ratio(const ModelMetrics& original, double target_size_mb,
                                           double cap, std::string_view strategy) {
      if (!(original.size_mb > 0.0)) {
        return Unexpected(std::format("{}: original size_mb must be positive, got {}", strategy,
                                      original.size_mb));
      }
      return std::min(cap, 1.0 - target_size_mb / original.size_mb);
    }

    template <class... Ts> struct overloaded : Ts... {
      using Ts::operator()...;
    };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

  }  // namespace

  std::string_view to_string(StrategyKind kind) noexcept {
    switch (kind) {
      case StrategyKind::Pruning:
        return "pruning";
      case StrategyKind::Quantization:
        return "quantization";
      case StrategyKind::Distillation:
        return "distillation";
      case StrategyKind::GraphOptimization:
        return "optimization";
    }
    return "unknown";
  }

  std::optional<StrategyKind> parse_strategy_kind(std::string_view name) noexcept {
    for (auto kind : kStrategyOrder) {
      if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
  }

  std::string_view to_string(QuantizationLevel level) noexcept {
    switch (level) {
      case QuantizationLevel::Int8:
        return "int8";
      case QuantizationLevel::Int16:
        return "int16";
      case QuantizationLevel::Float16:
        return "float16";
    }
    return "unknown";
  }

  void to_json(json& j, const OptimizedMetrics& optimized) {
    j = optimized.metrics;
    std::visit(overloaded{[](std::monostate) {},
                          [&](const PruningDetail& d) { j["pruning_ratio"] = d.pruning_ratio; },
                          [&](const QuantizationDetail& d) {
                            j["quantization_level"] = std::string(to_string(d.quantization_level));
                          },
                          [&](const DistillationDetail& d) {
                            j["distillation_ratio"] = d.distillation_ratio;
                          },
                          [&](const GraphOptimizationDetail& d) {
                            j["optimization_applied"] = d.optimization_applied;
                          }},
               optimized.detail);
  }

  // =============================================================================
  // Pruning
  // =============================================================================

  Result<OptimizedMetrics, std::string> PruningStrategy::apply(const ModelMetrics& original,
                                                               double target_size_mb) const {
    auto ratio = size_ratio(original, target_size_mb, kMaxRatio, name());
    if (!ratio) return Unexpected(ratio.error());
    const double r = *ratio;

    return OptimizedMetrics{
        .metrics = {.size_mb = original.size_mb * (1.0 - r),
                    .inference_time_ms = original.inference_time_ms * (1.0 - r * kLatencyFactor),
                    .accuracy = original.accuracy * (1.0 - r * kAccuracyFactor),
                    .memory_usage_mb = original.memory_usage_mb * (1.0 - r),
                    .parameters = scale_parameters(original.parameters, 1.0 - r)},
        .detail = PruningDetail{.pruning_ratio = r}};
  }

  // =============================================================================
  // Quantization
  // =============================================================================

  QuantizationStrategy::Regime QuantizationStrategy::select_regime(double original_size_mb,
                                                                   double target_size_mb) noexcept {
    if (target_size_mb < original_size_mb * 0.25) {
      return {QuantizationLevel::Int8, 0.75, 0.4, 0.02};
    }
    if (target_size_mb < original_size_mb * 0.5) {
      return {QuantizationLevel::Int16, 0.5, 0.2, 0.01};
    }
    return {QuantizationLevel::Float16, 0.25, 0.1, 0.005};
  }

  Result<OptimizedMetrics, std::string> QuantizationStrategy::apply(const ModelMetrics& original,
                                                                    double target_size_mb) const {
    const auto regime = select_regime(original.size_mb, target_size_mb);

    // accuracy_drop is absolute, not relative
    return OptimizedMetrics{
        .metrics
        = {.size_mb = original.size_mb * (1.0 - regime.size_reduction),
           .inference_time_ms = original.inference_time_ms * (1.0 - regime.speed_improvement),
           .accuracy = original.accuracy - regime.accuracy_drop,
           .memory_usage_mb = original.memory_usage_mb * (1.0 - regime.size_reduction),
           .parameters = original.parameters},
        .detail = QuantizationDetail{.quantization_level = regime.level}};
  }

  // =============================================================================
  // Knowledge distillation
  // =============================================================================

  Result<OptimizedMetrics, std::string> DistillationStrategy::apply(const ModelMetrics& original,
                                                                    double target_size_mb) const {
    auto reduction = size_ratio(original, target_size_mb, kMaxReduction, name());
    if (!reduction) return Unexpected(reduction.error());
    const double r = *reduction;

    return OptimizedMetrics{
        .metrics = {.size_mb = original.size_mb * (1.0 - r),
                    .inference_time_ms = original.inference_time_ms * (1.0 - r * kLatencyFactor),
                    .accuracy = original.accuracy * kAccuracyRetention,
                    .memory_usage_mb = original.memory_usage_mb * (1.0 - r),
                    .parameters = scale_parameters(original.parameters, 1.0 - r)},
        .detail = DistillationDetail{.distillation_ratio = r}};
  }

  // =============================================================================
  // Graph optimization
  // =============================================================================

  Result<OptimizedMetrics, std::string> GraphOptimizationStrategy::apply(
      const ModelMetrics& original, double /*target_size_mb*/) const {
    return OptimizedMetrics{
        .metrics = {.size_mb = original.size_mb * (1.0 - kFactor),
                    .inference_time_ms = original.inference_time_ms * (1.0 - kFactor),
                    .accuracy = original.accuracy,
                    .memory_usage_mb = original.memory_usage_mb * (1.0 - kFactor),
                    .parameters = original.parameters},
        .detail = GraphOptimizationDetail{}};
  }

  std::unique_ptr<IOptimizationStrategy> create_strategy(StrategyKind kind) {
    switch (kind) {
      case StrategyKind::Pruning:
        return std::make_unique<PruningStrategy>();
      case StrategyKind::Quantization:
        return std::make_unique<QuantizationStrategy>();
      case StrategyKind::Distillation:
        return std::make_unique<DistillationStrategy>();
      case StrategyKind::GraphOptimization:
        return std::make_unique<GraphOptimizationStrategy>();
    }
    throw std::invalid_argument("create_strategy: unknown strategy kind");
  }

}  // namespace xrayopt
