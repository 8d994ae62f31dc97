#include <algorithm>
#include <xrayopt_core/report.hpp>

using json = nlohmann::json;

namespace xrayopt {

  StrategyResult StrategyResult::failure(std::string optimization_type, std::string message) {
    StrategyResult result;
    result.optimization_type = std::move(optimization_type);
    result.optimization_applied = false;
    result.error = std::move(message);
    return result;
  }

  const StrategyResult* ComparisonReport::find(std::string_view optimization_type) const noexcept {
    auto it = std::ranges::find(strategies, optimization_type, &StrategyResult::optimization_type);
    return it == strategies.end() ? nullptr : &*it;
  }

  // ============================================================================
  // JSON Serialization
  // ============================================================================

  void to_json(json& j, const StrategyResult& r) {
    if (r.error) {
      j = {{"optimization_type", r.optimization_type},
           {"error", *r.error},
           {"optimization_applied", false}};
      return;
    }
    j = {{"optimization_type", r.optimization_type},
         {"original_metrics", r.original_metrics},
         {"optimized_metrics", r.optimized_metrics},
         {"improvements", r.improvements},
         {"optimization_applied", r.optimization_applied}};
  }

  void to_json(json& j, const ComparisonReport& report) {
    json strategies = json::object();
    for (const auto& result : report.strategies) {
      strategies[result.optimization_type] = result;
    }
    j = {{"strategies", std::move(strategies)},
         {"best_strategy", report.best_strategy},
         {"recommendation", report.recommendation}};
  }

  void to_json(json& j, const OptimizationSummary& s) {
    j = {{"total_strategies_tested", s.total_strategies_tested},
         {"best_strategy", s.best_strategy},
         {"achievable_size_mb", s.achievable_size_mb},
         {"recommendation", s.recommendation}};
  }

  void to_json(json& j, const OptimizationReport& report) {
    j = {{"model_info", report.model_info},
         {"target_size_mb", report.target_size_mb},
         {"optimization_comparison", report.optimization_comparison},
         {"summary", report.summary},
         {"next_steps", report.next_steps}};
  }

  std::string OptimizationReport::to_json_string(int indent) const {
    json j = *this;
    return j.dump(indent);
  }

}  // namespace xrayopt
