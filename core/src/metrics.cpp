#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <xrayopt_core/metrics.hpp>

using json = nlohmann::json;

namespace xrayopt {

  namespace {

    double number_or(const ModelInfo& info, const char* key, double fallback) noexcept {
      auto it = info.find(key);
      if (it == info.end() || !it->is_number()) return fallback;
      return it->get<double>();
    }

    std::int64_t count_or(const ModelInfo& info, const char* key,
                          std::int64_t fallback) noexcept {
      auto it = info.find(key);
      if (it == info.end() || !it->is_number()) return fallback;
      if (it->is_number_integer()) return it->get<std::int64_t>();
      return saturate_count(it->get<double>());
    }

    std::optional<double> percent_change(double original, double optimized) noexcept {
      if (!(original > 0.0)) return std::nullopt;
      return round_to((original - optimized) / original * 100.0, 2);
    }

  }  // namespace

  double round_to(double value, int decimals) noexcept {
    if (!std::isfinite(value)) return value;

    // Fixed notation of the largest double needs 309 integer digits
    std::array<char, 400> buffer;
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::fixed, decimals);
    if (ec != std::errc{}) return value;

    double rounded = value;
    if (std::from_chars(buffer.data(), end, rounded).ec != std::errc{}) return value;
    return rounded;
  }

  std::int64_t saturate_count(double value) noexcept {
    using limits = std::numeric_limits<std::int64_t>;
    if (std::isnan(value)) return 0;
    // 2^63 is exactly representable; anything at or above it overflows
    if (value >= 9223372036854775808.0) return limits::max();
    if (value <= static_cast<double>(limits::min())) return limits::min();
    return static_cast<std::int64_t>(value);
  }

  ModelMetrics extract_metrics(const ModelInfo& model_info, const MetricDefaults& defaults) noexcept {
    return ModelMetrics{
        .size_mb = number_or(model_info, "size_mb", defaults.size_mb),
        .inference_time_ms = number_or(model_info, "inference_time_ms", defaults.inference_time_ms),
        .accuracy = number_or(model_info, "accuracy", defaults.accuracy),
        .memory_usage_mb = number_or(model_info, "memory_usage_mb", defaults.memory_usage_mb),
        .parameters = count_or(model_info, "parameters", defaults.parameters)};
  }

  ImprovementSet calculate_improvements(const ModelMetrics& original,
                                        const ModelMetrics& optimized) noexcept {
    return ImprovementSet{
        .size_mb_improvement_percent = percent_change(original.size_mb, optimized.size_mb),
        .inference_time_ms_improvement_percent
        = percent_change(original.inference_time_ms, optimized.inference_time_ms),
        .memory_usage_mb_improvement_percent
        = percent_change(original.memory_usage_mb, optimized.memory_usage_mb),
        .accuracy_change = round_to(optimized.accuracy - original.accuracy, 4)};
  }

  void to_json(json& j, const ModelMetrics& m) {
    j = {{"size_mb", m.size_mb},
         {"inference_time_ms", m.inference_time_ms},
         {"accuracy", m.accuracy},
         {"memory_usage_mb", m.memory_usage_mb},
         {"parameters", m.parameters}};
  }

  void to_json(json& j, const ImprovementSet& s) {
    j = json::object();
    if (s.size_mb_improvement_percent) {
      j["size_mb_improvement_percent"] = *s.size_mb_improvement_percent;
    }
    if (s.inference_time_ms_improvement_percent) {
      j["inference_time_ms_improvement_percent"] = *s.inference_time_ms_improvement_percent;
    }
    if (s.memory_usage_mb_improvement_percent) {
      j["memory_usage_mb_improvement_percent"] = *s.memory_usage_mb_improvement_percent;
    }
    j["accuracy_change"] = s.accuracy_change;
  }

}  // namespace xrayopt
