#include <gtest/gtest.h>

#include <vector>
#include <xrayopt_core/scorer.hpp>

using namespace xrayopt;

namespace {

  StrategyResult make_result(std::string type, std::optional<double> size_pct,
                             std::optional<double> speed_pct, double accuracy_change) {
    StrategyResult r;
    r.optimization_type = std::move(type);
    r.improvements.size_mb_improvement_percent = size_pct;
    r.improvements.inference_time_ms_improvement_percent = speed_pct;
    r.improvements.accuracy_change = accuracy_change;
    r.optimization_applied = true;
    return r;
  }

}  // namespace

TEST(StrategyScorerTest, CompositeScore) {
  StrategyScorer scorer;
  auto result = make_result("quantization", 75.0, 40.0, -0.02);
  auto s = scorer.score(result);

  EXPECT_EQ(s.optimization_type, "quantization");
  EXPECT_NEAR(s.size_score, 0.75, 1e-12);
  EXPECT_NEAR(s.speed_score, 0.40, 1e-12);
  EXPECT_NEAR(s.accuracy_score, 0.98, 1e-12);
  EXPECT_NEAR(s.score, 0.714, 1e-12);
}

TEST(StrategyScorerTest, MissingImprovementsScoreZero) {
  StrategyScorer scorer;
  auto s = scorer.score(make_result("pruning", std::nullopt, std::nullopt, 0.0));

  EXPECT_DOUBLE_EQ(s.size_score, 0.0);
  EXPECT_DOUBLE_EQ(s.speed_score, 0.0);
  EXPECT_NEAR(s.score, 0.3, 1e-12);
}

TEST(StrategyScorerTest, AccuracyScoreClampedAtZero) {
  StrategyScorer scorer;
  auto s = scorer.score(make_result("pruning", 0.0, 0.0, -1.5));
  EXPECT_DOUBLE_EQ(s.accuracy_score, 0.0);
}

TEST(StrategyScorerTest, CustomWeights) {
  StrategyScorer scorer(ScoringWeights{.size = 1.0, .speed = 0.0, .accuracy = 0.0});
  auto s = scorer.score(make_result("distillation", 60.0, 30.0, -0.02));
  EXPECT_NEAR(s.score, 0.6, 1e-12);
}

TEST(StrategyScorerTest, SelectBestPicksHighestComposite) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {
      make_result("pruning", 70.0, 21.0, -0.0322),
      make_result("quantization", 75.0, 40.0, -0.02),
      make_result("distillation", 60.0, 30.0, -0.0184),
      make_result("optimization", 15.0, 15.0, 0.0),
  };

  EXPECT_EQ(scorer.select_best(results), "quantization");
}

TEST(StrategyScorerTest, TiesGoToEarlierEntry) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {
      make_result("optimization", 15.0, 15.0, 0.0),
      make_result("pruning", 15.0, 15.0, 0.0),
  };

  EXPECT_EQ(scorer.select_best(results), "optimization");
}

TEST(StrategyScorerTest, ErrorResultsAreSkipped) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {
      StrategyResult::failure("quantization", "boom"),
      make_result("optimization", 15.0, 15.0, 0.0),
  };

  EXPECT_EQ(scorer.select_best(results), "optimization");
}

TEST(StrategyScorerTest, AllErrorsFallBack) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {
      StrategyResult::failure("pruning", "a"),
      StrategyResult::failure("distillation", "b"),
  };

  EXPECT_EQ(scorer.select_best(results), "quantization");
  EXPECT_EQ(scorer.select_best(results, "optimization"), "optimization");
  EXPECT_EQ(scorer.select_best({}), "quantization");
}

TEST(StrategyScorerTest, NegativeCompositeCanStillWin) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {make_result("pruning", -200.0, -50.0, -1.0)};

  EXPECT_LT(scorer.score(results[0]).score, 0.0);
  EXPECT_EQ(scorer.select_best(results), "pruning");
}

TEST(StrategyScorerTest, CompositeAtOrBelowMinusOneIsNeverSelected) {
  StrategyScorer scorer;
  // 0.4 * -9.0 + 0.3 * -2.7 + 0.3 * 1.45 = -3.975
  std::vector<StrategyResult> results = {make_result("pruning", -900.0, -270.0, 0.45)};

  EXPECT_LE(scorer.score(results[0]).score, StrategyScorer::kMinSelectableScore);
  EXPECT_EQ(scorer.select_best(results), "quantization");
  EXPECT_EQ(scorer.select_best(results, "optimization"), "optimization");

  results.push_back(make_result("distillation", -200.0, -50.0, -1.0));
  EXPECT_EQ(scorer.select_best(results), "distillation");
}

TEST(StrategyScorerTest, RankOrdersDescendingAndDropsErrors) {
  StrategyScorer scorer;
  std::vector<StrategyResult> results = {
      make_result("optimization", 15.0, 15.0, 0.0),
      StrategyResult::failure("pruning", "boom"),
      make_result("quantization", 75.0, 40.0, -0.02),
      make_result("distillation", 15.0, 15.0, 0.0),
  };

  auto ranked = scorer.rank(results);
  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].optimization_type, "quantization");
  EXPECT_EQ(ranked[1].optimization_type, "optimization");
  EXPECT_EQ(ranked[2].optimization_type, "distillation");
}
