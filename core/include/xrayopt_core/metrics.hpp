#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace xrayopt {

  /// Caller-supplied model description. Any subset of size_mb, inference_time_ms, accuracy,
  /// memory_usage_mb and parameters may be present; other keys are carried through untouched.
  using ModelInfo = nlohmann::json;

  struct MetricDefaults {
    double size_mb = 100.0;
    double inference_time_ms = 500.0;
    double accuracy = 0.92;
    double memory_usage_mb = 200.0;
    std::int64_t parameters = 1'000'000;
  };

  struct ModelMetrics {
    double size_mb = 0.0;
    double inference_time_ms = 0.0;
    double accuracy = 0.0;
    double memory_usage_mb = 0.0;
    std::int64_t parameters = 0;

    bool operator==(const ModelMetrics&) const = default;
  };

  /// Relative change between an original and an optimized model. A percentage is absent when
  /// the original value was not positive.
  struct ImprovementSet {
    std::optional<double> size_mb_improvement_percent;
    std::optional<double> inference_time_ms_improvement_percent;
    std::optional<double> memory_usage_mb_improvement_percent;
    double accuracy_change = 0.0;

    bool operator==(const ImprovementSet&) const = default;
  };

  // Missing or non-numeric fields are replaced by the matching default
  [[nodiscard]] ModelMetrics extract_metrics(const ModelInfo& model_info,
                                             const MetricDefaults& defaults = {}) noexcept;

  // Percentages rounded to 2 decimals, accuracy_change to 4
  [[nodiscard]] ImprovementSet calculate_improvements(const ModelMetrics& original,
                                                      const ModelMetrics& optimized) noexcept;

  // Rounds the exact binary value half-to-even, so 2.675 (stored as 2.67499...) gives 2.67.
  // Non-finite values are returned unchanged.
  [[nodiscard]] double round_to(double value, int decimals) noexcept;

  // Saturating double to int64 conversion for parameter counts; NaN maps to 0
  [[nodiscard]] std::int64_t saturate_count(double value) noexcept;

  void to_json(nlohmann::json& j, const ModelMetrics& metrics);
  void to_json(nlohmann::json& j, const ImprovementSet& improvements);

}  // namespace xrayopt
