#pragma once
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "metrics.hpp"
#include "report.hpp"
#include "result.hpp"
#include "scorer.hpp"
#include "strategy.hpp"

namespace xrayopt {

  /// Runs simulated compression strategies against a model description and assembles
  /// comparison reports. Stateless between calls; safe to share across threads once built.
  ///
  /// None of the public operations throw: a failing strategy degrades to the original metrics
  /// or to an error entry, and report-level failures come back as Unexpected.
  class ModelOptimizer {
  public:
    using StrategyList = std::vector<std::unique_ptr<IOptimizationStrategy>>;

    explicit ModelOptimizer(OptimizerConfig config = {});
    ModelOptimizer(OptimizerConfig config, StrategyList strategies);

    ModelOptimizer(ModelOptimizer&&) = default;
    ModelOptimizer& operator=(ModelOptimizer&&) = default;
    ModelOptimizer(const ModelOptimizer&) = delete;
    ModelOptimizer& operator=(const ModelOptimizer&) = delete;

    // Pruning, quantization, distillation and graph optimization, in that order
    [[nodiscard]] static StrategyList default_strategies();

    [[nodiscard]] ModelMetrics extract_metrics(const ModelInfo& model_info) const noexcept;

    [[nodiscard]] StrategyResult optimize_model(
        const ModelInfo& model_info, std::string_view optimization_type,
        std::optional<double> target_size_mb = std::nullopt) const noexcept;

    [[nodiscard]] Result<ComparisonReport, std::string> compare_strategies(
        const ModelInfo& model_info, std::optional<double> target_size_mb = std::nullopt) const noexcept;

    [[nodiscard]] Result<OptimizationReport, std::string> build_report(
        const ModelInfo& model_info, std::optional<double> target_size_mb = std::nullopt) const noexcept;

    [[nodiscard]] std::string select_best(std::span<const StrategyResult> results) const;

    [[nodiscard]] std::vector<std::string> strategy_names() const;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const StrategyScorer& scorer() const noexcept { return scorer_; }

  private:
    [[nodiscard]] const IOptimizationStrategy* find_strategy(std::string_view name) const noexcept;

    [[nodiscard]] StrategyResult run_strategy(const IOptimizationStrategy& strategy,
                                              const ModelInfo& model_info,
                                              double target_size_mb) const;

    OptimizerConfig config_;
    StrategyScorer scorer_;
    StrategyList strategies_;
  };

}  // namespace xrayopt
