#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <xrayopt_core/logging.hpp>
#include <xrayopt_core/optimizer.hpp>
#include <xrayopt_core/recommendations.hpp>
#include <xrayopt_core/tracy.hpp>

namespace xrayopt {

  ModelOptimizer::ModelOptimizer(OptimizerConfig config)
      : ModelOptimizer(std::move(config), default_strategies()) {}

  ModelOptimizer::ModelOptimizer(OptimizerConfig config, StrategyList strategies)
      : config_(std::move(config)), scorer_(config_.scoring), strategies_(std::move(strategies)) {
    config_.validate();

    if (std::ranges::any_of(strategies_, [](const auto& s) { return s == nullptr; })) {
      throw std::invalid_argument("ModelOptimizer: strategy list contains a null entry");
    }
  }

  ModelOptimizer::StrategyList ModelOptimizer::default_strategies() {
    StrategyList strategies;
    strategies.reserve(kStrategyOrder.size());
    for (auto kind : kStrategyOrder) {
      strategies.push_back(create_strategy(kind));
    }
    return strategies;
  }

  ModelMetrics ModelOptimizer::extract_metrics(const ModelInfo& model_info) const noexcept {
    return xrayopt::extract_metrics(model_info, config_.metric_defaults);
  }

  const IOptimizationStrategy* ModelOptimizer::find_strategy(std::string_view name) const noexcept {
    auto it = std::ranges::find_if(strategies_, [&](const auto& s) { return s->name() == name; });
    return it == strategies_.end() ? nullptr : it->get();
  }

  std::vector<std::string> ModelOptimizer::strategy_names() const {
    auto names = strategies_
                 | std::views::transform([](const auto& s) { return std::string(s->name()); });
    return {names.begin(), names.end()};
  }

  std::string ModelOptimizer::select_best(std::span<const StrategyResult> results) const {
    return scorer_.select_best(results, config_.fallback_strategy);
  }

  StrategyResult ModelOptimizer::run_strategy(const IOptimizationStrategy& strategy,
                                              const ModelInfo& model_info,
                                              double target_size_mb) const {
    XRAYOPT_ZONE;
    const auto original = extract_metrics(model_info);

    // A strategy whose precondition fails reports the model unchanged
    OptimizedMetrics optimized{.metrics = original, .detail = std::monostate{}};
    try {
      auto applied = strategy.apply(original, target_size_mb);
      if (applied) {
        optimized = std::move(applied).value();
      } else {
        Logger::warn(std::format("Error applying {}: {}", strategy.name(), applied.error()));
      }
    } catch (const std::exception& e) {
      Logger::warn(std::format("Error applying {}: {}", strategy.name(), e.what()));
    } catch (...) {
      // compare_strategies is noexcept; a non-standard exception must not reach it
      Logger::warn(std::format("Error applying {}: unknown exception", strategy.name()));
    }

    StrategyResult result;
    result.optimization_type = std::string(strategy.name());
    result.original_metrics = original;
    result.improvements = calculate_improvements(original, optimized.metrics);
    result.optimized_metrics = std::move(optimized);
    result.optimization_applied = true;
    return result;
  }

  StrategyResult ModelOptimizer::optimize_model(const ModelInfo& model_info,
                                                std::string_view optimization_type,
                                                std::optional<double> target_size_mb) const noexcept {
    XRAYOPT_ZONE;
    try {
      const auto* strategy = find_strategy(optimization_type);
      if (!strategy) {
        return StrategyResult::failure(
            std::string(optimization_type),
            std::format("Unknown optimization type: {}", optimization_type));
      }
      return run_strategy(*strategy, model_info,
                          target_size_mb.value_or(config_.default_target_size_mb));
    } catch (const std::exception& e) {
      Logger::error(std::format("Error optimizing model: {}", e.what()));
      return StrategyResult::failure(std::string(optimization_type), e.what());
    }
  }

  Result<ComparisonReport, std::string> ModelOptimizer::compare_strategies(
      const ModelInfo& model_info, std::optional<double> target_size_mb) const noexcept {
    XRAYOPT_ZONE;
    try {
      const double target = target_size_mb.value_or(config_.default_target_size_mb);

      ComparisonReport report;
      report.strategies.reserve(strategies_.size());

      // One failing strategy must not take the others down
      for (const auto& strategy : strategies_) {
        try {
          report.strategies.push_back(run_strategy(*strategy, model_info, target));
        } catch (const std::exception& e) {
          Logger::error(std::format("Strategy {} failed: {}", strategy->name(), e.what()));
          report.strategies.push_back(
              StrategyResult::failure(std::string(strategy->name()), e.what()));
        }
      }

      report.best_strategy = select_best(report.strategies);
      report.recommendation = std::string(recommendation_for(report.best_strategy));
      return report;
    } catch (const std::exception& e) {
      Logger::error(std::format("Error comparing optimization strategies: {}", e.what()));
      return Unexpected(std::string(e.what()));
    }
  }

  Result<OptimizationReport, std::string> ModelOptimizer::build_report(
      const ModelInfo& model_info, std::optional<double> target_size_mb) const noexcept {
    XRAYOPT_ZONE;
    try {
      const double target = target_size_mb.value_or(config_.default_target_size_mb);

      auto comparison = compare_strategies(model_info, target);
      if (!comparison) {
        return Unexpected(comparison.error());
      }

      OptimizationReport report;
      report.model_info = model_info;
      report.target_size_mb = target;
      report.optimization_comparison = std::move(comparison).value();

      const auto& cmp = report.optimization_comparison;
      report.summary = OptimizationSummary{
          .total_strategies_tested = static_cast<int>(cmp.strategies.size()),
          .best_strategy = cmp.best_strategy,
          .achievable_size_mb = achievable_size_mb(extract_metrics(model_info).size_mb, target),
          .recommendation = cmp.recommendation};
      report.next_steps = next_steps_for(cmp.best_strategy);
      return report;
    } catch (const std::exception& e) {
      Logger::error(std::format("Error generating optimization report: {}", e.what()));
      return Unexpected(std::string(e.what()));
    }
  }

}  // namespace xrayopt
