#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "report.hpp"

namespace xrayopt {

  struct ScoringWeights {
    double size = 0.4;
    double speed = 0.3;
    double accuracy = 0.3;
  };

  struct StrategyScore {
    std::string_view optimization_type;  // References the scored StrategyResult (no copy)
    double score;
    double size_score;
    double speed_score;
    double accuracy_score;
  };

  class StrategyScorer {
  public:
    // A composite must exceed this to be selected
    static constexpr double kMinSelectableScore = -1.0;

    explicit StrategyScorer(ScoringWeights weights = {}) : weights_(weights) {}

    // size and speed scores are improvement fractions (0 when absent); the accuracy score is
    // max(0, accuracy_change + 1)
    [[nodiscard]] StrategyScore score(const StrategyResult& result) const noexcept;

    // Healthy results ranked by descending composite score; equal scores keep input order
    [[nodiscard]] std::vector<StrategyScore> rank(std::span<const StrategyResult> results) const;

    // First strictly greatest composite above kMinSelectableScore among healthy results,
    // else fallback
    [[nodiscard]] std::string select_best(std::span<const StrategyResult> results,
                                          std::string_view fallback = "quantization") const;

    [[nodiscard]] const ScoringWeights& weights() const noexcept { return weights_; }

  private:
    ScoringWeights weights_;
  };

}  // namespace xrayopt
