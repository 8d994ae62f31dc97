#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <xrayopt_core/config.hpp>
#include <xrayopt_core/tracy.hpp>

using json = nlohmann::json;

namespace xrayopt {

  // ============================================================================
  // JSON Serialization - ScoringWeights
  // ============================================================================

  void to_json(json& j, const ScoringWeights& w) {
    j = {{"size", w.size}, {"speed", w.speed}, {"accuracy", w.accuracy}};
  }

  void from_json(const json& j, ScoringWeights& w) {
    w.size = j.value("size", 0.4);
    w.speed = j.value("speed", 0.3);
    w.accuracy = j.value("accuracy", 0.3);
  }

  // ============================================================================
  // JSON Serialization - MetricDefaults
  // ============================================================================

  void to_json(json& j, const MetricDefaults& d) {
    j = {{"size_mb", d.size_mb},
         {"inference_time_ms", d.inference_time_ms},
         {"accuracy", d.accuracy},
         {"memory_usage_mb", d.memory_usage_mb},
         {"parameters", d.parameters}};
  }

  void from_json(const json& j, MetricDefaults& d) {
    MetricDefaults fallback;
    d.size_mb = j.value("size_mb", fallback.size_mb);
    d.inference_time_ms = j.value("inference_time_ms", fallback.inference_time_ms);
    d.accuracy = j.value("accuracy", fallback.accuracy);
    d.memory_usage_mb = j.value("memory_usage_mb", fallback.memory_usage_mb);
    d.parameters = j.value("parameters", fallback.parameters);
  }

  // ============================================================================
  // File I/O
  // ============================================================================

  OptimizerConfig OptimizerConfig::from_json(const std::string& path) {
    XRAYOPT_ZONE;
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open config file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  OptimizerConfig OptimizerConfig::from_json_string(const std::string& json_str) {
    json j = json::parse(json_str);

    OptimizerConfig config;
    config.default_target_size_mb = j.value("default_target_size_mb", 10.0);
    config.fallback_strategy = j.value("fallback_strategy", "quantization");
    config.default_model = j.value("default_model", "efficientnet");

    if (j.contains("scoring")) {
      j.at("scoring").get_to(config.scoring);
    }
    if (j.contains("metric_defaults")) {
      j.at("metric_defaults").get_to(config.metric_defaults);
    }

    config.validate();
    return config;
  }

  std::string OptimizerConfig::to_json_string() const {
    json j;
    j["default_target_size_mb"] = default_target_size_mb;
    j["fallback_strategy"] = fallback_strategy;
    j["default_model"] = default_model;
    j["scoring"] = scoring;
    j["metric_defaults"] = metric_defaults;
    return j.dump(2);
  }

  void OptimizerConfig::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open config file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void OptimizerConfig::validate() const {
    if (!(default_target_size_mb > 0.0)) {
      throw std::invalid_argument(
          std::format("default_target_size_mb must be positive, got {}", default_target_size_mb));
    }

    if (fallback_strategy.empty()) {
      throw std::invalid_argument("fallback_strategy cannot be empty");
    }

    if (scoring.size < 0.0 || scoring.speed < 0.0 || scoring.accuracy < 0.0) {
      throw std::invalid_argument(std::format(
          "scoring weights must be non-negative, got size={} speed={} accuracy={}", scoring.size,
          scoring.speed, scoring.accuracy));
    }

    if (!(metric_defaults.size_mb > 0.0)) {
      throw std::invalid_argument(
          std::format("metric_defaults.size_mb must be positive, got {}", metric_defaults.size_mb));
    }
  }

}  // namespace xrayopt
