#include <gtest/gtest.h>

#include <fixtures/fixtures_loader.hpp>
#include <xrayopt_core/optimizer.hpp>
#include <xrayopt_core/report.hpp>

using namespace xrayopt;
using json = nlohmann::json;
using xrayopt::testing::FixturesLoader;

class ReportJsonTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto built = optimizer_.build_report(FixturesLoader::resnet50_info(), 10.0);
    ASSERT_TRUE(built.has_value());
    report_ = std::move(built).value();
    j_ = json::parse(report_.to_json_string());
  }

  ModelOptimizer optimizer_;
  OptimizationReport report_;
  json j_;
};

TEST_F(ReportJsonTest, TopLevelKeys) {
  EXPECT_TRUE(j_.contains("model_info"));
  EXPECT_DOUBLE_EQ(j_.at("target_size_mb").get<double>(), 10.0);
  EXPECT_TRUE(j_.contains("optimization_comparison"));
  EXPECT_TRUE(j_.contains("summary"));
  EXPECT_EQ(j_.at("next_steps").size(), 4u);
}

TEST_F(ReportJsonTest, StrategiesKeyedByName) {
  const auto& strategies = j_.at("optimization_comparison").at("strategies");
  ASSERT_TRUE(strategies.is_object());
  EXPECT_EQ(strategies.size(), 4u);
  for (const char* name : {"pruning", "quantization", "distillation", "optimization"}) {
    ASSERT_TRUE(strategies.contains(name)) << name;
    EXPECT_EQ(strategies.at(name).at("optimization_type").get<std::string>(), name);
    EXPECT_TRUE(strategies.at(name).at("optimization_applied").get<bool>());
  }
}

TEST_F(ReportJsonTest, PruningRatioPath) {
  const auto& ratio = j_["optimization_comparison"]["strategies"]["pruning"]["optimized_metrics"]
                        ["pruning_ratio"];
  ASSERT_TRUE(ratio.is_number());
  EXPECT_DOUBLE_EQ(ratio.get<double>(), 0.7);
}

TEST_F(ReportJsonTest, QuantizationLevelPath) {
  const auto& level = j_["optimization_comparison"]["strategies"]["quantization"]
                        ["optimized_metrics"]["quantization_level"];
  EXPECT_EQ(level.get<std::string>(), "int8");
}

TEST_F(ReportJsonTest, SummaryFields) {
  const auto& summary = j_.at("summary");
  EXPECT_EQ(summary.at("total_strategies_tested").get<int>(), 4);
  EXPECT_EQ(summary.at("best_strategy").get<std::string>(), "quantization");
  EXPECT_NEAR(summary.at("achievable_size_mb").get<double>(), 10.0, 1e-9);
  EXPECT_EQ(summary.at("recommendation").get<std::string>(),
            j_["optimization_comparison"]["recommendation"].get<std::string>());
}

TEST_F(ReportJsonTest, PrettyAndCompactOutputParseEqual) {
  auto compact = report_.to_json_string();
  auto pretty = report_.to_json_string(2);
  EXPECT_EQ(compact.find('\n'), std::string::npos);
  EXPECT_NE(pretty.find('\n'), std::string::npos);
  EXPECT_EQ(json::parse(compact), json::parse(pretty));
}

TEST(ComparisonReportTest, FindByName) {
  ComparisonReport report;
  report.strategies.push_back(StrategyResult::failure("pruning", "x"));
  report.strategies.push_back(StrategyResult::failure("quantization", "y"));

  ASSERT_NE(report.find("quantization"), nullptr);
  EXPECT_EQ(*report.find("quantization")->error, "y");
  EXPECT_EQ(report.find("distillation"), nullptr);
}

TEST(ComparisonReportTest, ErrorEntrySerialization) {
  ComparisonReport report;
  report.strategies.push_back(StrategyResult::failure("distillation", "bad input"));
  report.best_strategy = "quantization";

  json j = report;
  const auto& entry = j["strategies"]["distillation"];
  EXPECT_EQ(entry.size(), 3u);
  EXPECT_EQ(entry.at("error").get<std::string>(), "bad input");
  EXPECT_FALSE(entry.at("optimization_applied").get<bool>());
  EXPECT_EQ(j.at("best_strategy").get<std::string>(), "quantization");
}
