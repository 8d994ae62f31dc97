#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"

namespace xrayopt {

  inline constexpr const char* CATALOG_VERSION = "1.0";

  /// A screening classifier the service can run, with its simulated evaluation figures
  struct CatalogEntry {
    std::string name;  // e.g. "resnet50" (single source of truth)
    std::string description;
    std::array<int, 3> input_shape = {224, 224, 3};
    std::int64_t parameters = 0;
    double size_mb = 0.0;
    double inference_time_ms = 0.0;
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1_score = 0.0;
    std::optional<double> memory_usage_mb;

    // Registry data merged with performance metrics, in the shape extract_metrics() reads
    [[nodiscard]] ModelInfo to_model_info() const;
  };

  struct ModelCatalog {
    std::string version = CATALOG_VERSION;
    std::vector<CatalogEntry> models;

    // VGG16, ResNet50, MobileNetV2 and EfficientNet-B0
    [[nodiscard]] static ModelCatalog builtin();

    [[nodiscard]] static ModelCatalog from_json(const std::string& path);
    [[nodiscard]] static ModelCatalog from_json_string(const std::string& json_str);
    [[nodiscard]] static ModelCatalog from_msgpack(const std::string& path);
    [[nodiscard]] static ModelCatalog from_msgpack_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    void to_msgpack(const std::string& path) const;
    [[nodiscard]] std::string to_msgpack_string() const;

    void validate() const;

    [[nodiscard]] const CatalogEntry* find(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<ModelInfo> model_info(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }
  };

  void to_json(nlohmann::json& j, const CatalogEntry& entry);
  void from_json(const nlohmann::json& j, CatalogEntry& entry);

}  // namespace xrayopt
