#pragma once
#include <string>

#include "metrics.hpp"
#include "scorer.hpp"

namespace xrayopt {

  struct OptimizerConfig {
    double default_target_size_mb = 10.0;
    std::string fallback_strategy = "quantization";
    std::string default_model = "efficientnet";
    ScoringWeights scoring;
    MetricDefaults metric_defaults;

    [[nodiscard]] static OptimizerConfig from_json(const std::string& path);
    [[nodiscard]] static OptimizerConfig from_json_string(const std::string& json_str);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;

    void validate() const;
  };

  void to_json(nlohmann::json& j, const ScoringWeights& weights);
  void from_json(const nlohmann::json& j, ScoringWeights& weights);
  void to_json(nlohmann::json& j, const MetricDefaults& defaults);
  void from_json(const nlohmann::json& j, MetricDefaults& defaults);

}  // namespace xrayopt
