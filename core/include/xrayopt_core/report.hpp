#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"
#include "strategy.hpp"

namespace xrayopt {

  /// Outcome of running one strategy. When error is set the metric fields are meaningless and
  /// optimization_applied is false.
  struct StrategyResult {
    std::string optimization_type;
    ModelMetrics original_metrics;
    OptimizedMetrics optimized_metrics;
    ImprovementSet improvements;
    bool optimization_applied = false;
    std::optional<std::string> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    [[nodiscard]] static StrategyResult failure(std::string optimization_type, std::string message);
  };

  struct ComparisonReport {
    std::vector<StrategyResult> strategies;  // evaluation order
    std::string best_strategy;
    std::string recommendation;

    [[nodiscard]] const StrategyResult* find(std::string_view optimization_type) const noexcept;
  };

  struct OptimizationSummary {
    int total_strategies_tested = 0;
    std::string best_strategy;
    double achievable_size_mb = 0.0;
    std::string recommendation;
  };

  struct OptimizationReport {
    ModelInfo model_info;
    double target_size_mb = 0.0;
    ComparisonReport optimization_comparison;
    OptimizationSummary summary;
    std::vector<std::string> next_steps;

    // indent < 0 produces compact output
    [[nodiscard]] std::string to_json_string(int indent = -1) const;
  };

  void to_json(nlohmann::json& j, const StrategyResult& result);
  void to_json(nlohmann::json& j, const ComparisonReport& report);
  void to_json(nlohmann::json& j, const OptimizationSummary& summary);
  void to_json(nlohmann::json& j, const OptimizationReport& report);

}  // namespace xrayopt
