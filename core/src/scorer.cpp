#include <algorithm>
#include <ranges>
#include <xrayopt_core/scorer.hpp>
#include <xrayopt_core/tracy.hpp>

namespace xrayopt {

  StrategyScore StrategyScorer::score(const StrategyResult& result) const noexcept {
    const auto& imp = result.improvements;

    double size_score = imp.size_mb_improvement_percent.value_or(0.0) / 100.0;
    double speed_score = imp.inference_time_ms_improvement_percent.value_or(0.0) / 100.0;
    double accuracy_score = std::max(0.0, imp.accuracy_change + 1.0);

    return StrategyScore{.optimization_type = result.optimization_type,
                         .score = size_score * weights_.size + speed_score * weights_.speed
                                  + accuracy_score * weights_.accuracy,
                         .size_score = size_score,
                         .speed_score = speed_score,
                         .accuracy_score = accuracy_score};
  }

  std::vector<StrategyScore> StrategyScorer::rank(std::span<const StrategyResult> results) const {
    XRAYOPT_ZONE;
    auto healthy = results | std::views::filter(&StrategyResult::ok)
                   | std::views::transform([this](const StrategyResult& r) { return score(r); });

    std::vector<StrategyScore> scores(healthy.begin(), healthy.end());
    std::ranges::stable_sort(scores, std::ranges::greater{}, &StrategyScore::score);
    return scores;
  }

  std::string StrategyScorer::select_best(std::span<const StrategyResult> results,
                                          std::string_view fallback) const {
    double best_score = kMinSelectableScore;
    std::string_view best = fallback;

    for (const auto& result : results) {
      if (!result.ok()) continue;

      double composite = score(result).score;
      if (composite > best_score) {
        best_score = composite;
        best = result.optimization_type;
      }
    }

    return std::string(best);
  }

}  // namespace xrayopt
