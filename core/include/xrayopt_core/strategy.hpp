#pragma once
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "metrics.hpp"
#include "result.hpp"

namespace xrayopt {

  enum class StrategyKind { Pruning, Quantization, Distillation, GraphOptimization };

  // Evaluation order; ties in scoring go to the earlier entry
  inline constexpr std::array<StrategyKind, 4> kStrategyOrder
      = {StrategyKind::Pruning, StrategyKind::Quantization, StrategyKind::Distillation,
         StrategyKind::GraphOptimization};

  [[nodiscard]] std::string_view to_string(StrategyKind kind) noexcept;
  [[nodiscard]] std::optional<StrategyKind> parse_strategy_kind(std::string_view name) noexcept;

  enum class QuantizationLevel { Int8, Int16, Float16 };

  [[nodiscard]] std::string_view to_string(QuantizationLevel level) noexcept;

  // Strategy-specific field attached to the optimized metrics
  struct PruningDetail {
    double pruning_ratio;
  };

  struct QuantizationDetail {
    QuantizationLevel quantization_level;
  };

  struct DistillationDetail {
    double distillation_ratio;
  };

  struct GraphOptimizationDetail {
    bool optimization_applied = true;
  };

  // monostate: the strategy fell back to the original metrics
  using StrategyDetail = std::variant<std::monostate, PruningDetail, QuantizationDetail,
                                      DistillationDetail, GraphOptimizationDetail>;

  struct OptimizedMetrics {
    ModelMetrics metrics;
    StrategyDetail detail;
  };

  void to_json(nlohmann::json& j, const OptimizedMetrics& optimized);

  // =============================================================================
  // IOptimizationStrategy Interface
  // =============================================================================

  /// A simulated compression technique. apply() is a pure function of its arguments; a
  /// violated precondition is reported as an error instead of producing metrics.
  class IOptimizationStrategy {
  public:
    virtual ~IOptimizationStrategy() = default;

    IOptimizationStrategy(const IOptimizationStrategy&) = delete;
    IOptimizationStrategy& operator=(const IOptimizationStrategy&) = delete;
    IOptimizationStrategy(IOptimizationStrategy&&) = delete;
    IOptimizationStrategy& operator=(IOptimizationStrategy&&) = delete;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual Result<OptimizedMetrics, std::string> apply(
        const ModelMetrics& original, double target_size_mb) const = 0;

  protected:
    IOptimizationStrategy() = default;
  };

  class PruningStrategy : public IOptimizationStrategy {
  public:
    static constexpr double kMaxRatio = 0.7;
    static constexpr double kLatencyFactor = 0.3;
    static constexpr double kAccuracyFactor = 0.05;

    [[nodiscard]] std::string_view name() const noexcept override { return "pruning"; }

    [[nodiscard]] Result<OptimizedMetrics, std::string> apply(const ModelMetrics& original,
                                                              double target_size_mb) const override;
  };

  class QuantizationStrategy : public IOptimizationStrategy {
  public:
    struct Regime {
      QuantizationLevel level;
      double size_reduction;
      double speed_improvement;
      double accuracy_drop;
    };

    // int8 below 25% of the original size, int16 below 50%, float16 otherwise
    [[nodiscard]] static Regime select_regime(double original_size_mb,
                                              double target_size_mb) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override { return "quantization"; }

    [[nodiscard]] Result<OptimizedMetrics, std::string> apply(const ModelMetrics& original,
                                                              double target_size_mb) const override;
  };

  class DistillationStrategy : public IOptimizationStrategy {
  public:
    static constexpr double kMaxReduction = 0.6;
    static constexpr double kLatencyFactor = 0.5;
    static constexpr double kAccuracyRetention = 0.98;

    [[nodiscard]] std::string_view name() const noexcept override { return "distillation"; }

    [[nodiscard]] Result<OptimizedMetrics, std::string> apply(const ModelMetrics& original,
                                                              double target_size_mb) const override;
  };

  class GraphOptimizationStrategy : public IOptimizationStrategy {
  public:
    static constexpr double kFactor = 0.15;

    [[nodiscard]] std::string_view name() const noexcept override { return "optimization"; }

    [[nodiscard]] Result<OptimizedMetrics, std::string> apply(const ModelMetrics& original,
                                                              double target_size_mb) const override;
  };

  // =============================================================================
  // Factory Functions
  // =============================================================================

  [[nodiscard]] std::unique_ptr<IOptimizationStrategy> create_strategy(StrategyKind kind);

}  // namespace xrayopt
