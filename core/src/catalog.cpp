#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <map>
#include <msgpack.hpp>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <xrayopt_core/catalog.hpp>
#include <xrayopt_core/tracy.hpp>

using json = nlohmann::json;

namespace xrayopt {

  ModelInfo CatalogEntry::to_model_info() const {
    ModelInfo info = {{"name", name},
                      {"description", description},
                      {"input_shape", input_shape},
                      {"parameters", parameters},
                      {"size_mb", size_mb},
                      {"inference_time_ms", inference_time_ms},
                      {"accuracy", accuracy},
                      {"precision", precision},
                      {"recall", recall},
                      {"f1_score", f1_score}};
    if (memory_usage_mb) info["memory_usage_mb"] = *memory_usage_mb;
    return info;
  }

  ModelCatalog ModelCatalog::builtin() {
    ModelCatalog catalog;
    catalog.models = {
        CatalogEntry{.name = "vgg16",
                     .description = "VGG16 - Deep CNN with 16 layers",
                     .parameters = 138'357'544,
                     .size_mb = 528.0,
                     .inference_time_ms = 450.0,
                     .accuracy = 0.89,
                     .precision = 0.87,
                     .recall = 0.91,
                     .f1_score = 0.89},
        CatalogEntry{.name = "resnet50",
                     .description = "ResNet50 - Residual Network with 50 layers",
                     .parameters = 25'636'712,
                     .size_mb = 98.0,
                     .inference_time_ms = 380.0,
                     .accuracy = 0.92,
                     .precision = 0.90,
                     .recall = 0.94,
                     .f1_score = 0.92},
        CatalogEntry{.name = "mobilenetv2",
                     .description = "MobileNetV2 - Lightweight CNN for mobile devices",
                     .parameters = 3'538'984,
                     .size_mb = 14.0,
                     .inference_time_ms = 150.0,
                     .accuracy = 0.85,
                     .precision = 0.83,
                     .recall = 0.87,
                     .f1_score = 0.85},
        CatalogEntry{.name = "efficientnet",
                     .description = "EfficientNet-B0 - Efficient CNN with compound scaling",
                     .parameters = 5'330'571,
                     .size_mb = 29.0,
                     .inference_time_ms = 250.0,
                     .accuracy = 0.94,
                     .precision = 0.93,
                     .recall = 0.95,
                     .f1_score = 0.94},
    };
    return catalog;
  }

  // ============================================================================
  // JSON Serialization - CatalogEntry
  // ============================================================================

  void to_json(json& j, const CatalogEntry& e) {
    j = {{"name", e.name},
         {"description", e.description},
         {"input_shape", e.input_shape},
         {"parameters", e.parameters},
         {"size_mb", e.size_mb},
         {"inference_time_ms", e.inference_time_ms},
         {"accuracy", e.accuracy},
         {"precision", e.precision},
         {"recall", e.recall},
         {"f1_score", e.f1_score}};
    if (e.memory_usage_mb) j["memory_usage_mb"] = *e.memory_usage_mb;
  }

  void from_json(const json& j, CatalogEntry& e) {
    j.at("name").get_to(e.name);
    e.description = j.value("description", "");
    if (j.contains("input_shape")) j.at("input_shape").get_to(e.input_shape);
    e.parameters = j.value("parameters", std::int64_t{0});
    j.at("size_mb").get_to(e.size_mb);
    j.at("inference_time_ms").get_to(e.inference_time_ms);
    j.at("accuracy").get_to(e.accuracy);
    e.precision = j.value("precision", 0.0);
    e.recall = j.value("recall", 0.0);
    e.f1_score = j.value("f1_score", 0.0);
    if (j.contains("memory_usage_mb") && !j["memory_usage_mb"].is_null()) {
      e.memory_usage_mb = j["memory_usage_mb"].get<double>();
    }
  }

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  ModelCatalog ModelCatalog::from_json(const std::string& path) {
    XRAYOPT_ZONE;
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open catalog file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  ModelCatalog ModelCatalog::from_json_string(const std::string& json_str) {
    XRAYOPT_ZONE;
    json j = json::parse(json_str);

    ModelCatalog catalog;
    catalog.version = j.value("version", CATALOG_VERSION);
    catalog.models = j.at("models").get<std::vector<CatalogEntry>>();

    catalog.validate();
    return catalog;
  }

  std::string ModelCatalog::to_json_string() const {
    json j;
    j["version"] = version;
    j["models"] = models;
    return j.dump(2);
  }

  void ModelCatalog::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open catalog file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // MessagePack File I/O
  // ============================================================================

  ModelCatalog ModelCatalog::from_msgpack(const std::string& path) {
    XRAYOPT_ZONE;
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
      throw std::runtime_error(std::format("Failed to open msgpack file: {}", path));
    }

    auto file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(file_size), '\0');
    if (!file.read(data.data(), file_size)) {
      throw std::runtime_error(std::format("Failed to read msgpack file: {}", path));
    }

    return from_msgpack_string(data);
  }

  ModelCatalog ModelCatalog::from_msgpack_string(const std::string& data) {
    XRAYOPT_ZONE;

    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<std::map<std::string, msgpack::object>>();

    ModelCatalog catalog;
    catalog.version
        = map.contains("version") ? map.at("version").as<std::string>() : CATALOG_VERSION;

    if (!map.contains("models")) {
      throw std::invalid_argument("Missing required field: models");
    }

    auto models_arr = map.at("models").as<std::vector<msgpack::object>>();
    catalog.models.reserve(models_arr.size());
    for (const auto& model_obj : models_arr) {
      auto m = model_obj.as<std::map<std::string, msgpack::object>>();
      CatalogEntry entry;
      entry.name = m.at("name").as<std::string>();
      entry.description = m.contains("description") ? m.at("description").as<std::string>() : "";
      if (m.contains("input_shape")) {
        auto shape = m.at("input_shape").as<std::vector<int>>();
        if (shape.size() != entry.input_shape.size()) {
          throw std::invalid_argument(std::format(
              "Model '{}' input_shape must have 3 dimensions, got {}", entry.name, shape.size()));
        }
        std::ranges::copy(shape, entry.input_shape.begin());
      }
      entry.parameters = m.contains("parameters") ? m.at("parameters").as<std::int64_t>() : 0;
      entry.size_mb = m.at("size_mb").as<double>();
      entry.inference_time_ms = m.at("inference_time_ms").as<double>();
      entry.accuracy = m.at("accuracy").as<double>();
      entry.precision = m.contains("precision") ? m.at("precision").as<double>() : 0.0;
      entry.recall = m.contains("recall") ? m.at("recall").as<double>() : 0.0;
      entry.f1_score = m.contains("f1_score") ? m.at("f1_score").as<double>() : 0.0;
      if (m.contains("memory_usage_mb") && !m.at("memory_usage_mb").is_nil()) {
        entry.memory_usage_mb = m.at("memory_usage_mb").as<double>();
      }
      catalog.models.push_back(std::move(entry));
    }

    catalog.validate();
    return catalog;
  }

  std::string ModelCatalog::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(2);

    pk.pack("version");
    pk.pack(version);

    pk.pack("models");
    pk.pack_array(static_cast<uint32_t>(models.size()));
    for (const auto& model : models) {
      pk.pack_map(model.memory_usage_mb ? 11 : 10);
      pk.pack("name");
      pk.pack(model.name);
      pk.pack("description");
      pk.pack(model.description);
      pk.pack("input_shape");
      pk.pack(std::vector<int>(model.input_shape.begin(), model.input_shape.end()));
      pk.pack("parameters");
      pk.pack(model.parameters);
      pk.pack("size_mb");
      pk.pack(model.size_mb);
      pk.pack("inference_time_ms");
      pk.pack(model.inference_time_ms);
      pk.pack("accuracy");
      pk.pack(model.accuracy);
      pk.pack("precision");
      pk.pack(model.precision);
      pk.pack("recall");
      pk.pack(model.recall);
      pk.pack("f1_score");
      pk.pack(model.f1_score);
      if (model.memory_usage_mb) {
        pk.pack("memory_usage_mb");
        pk.pack(*model.memory_usage_mb);
      }
    }

    return std::string(buffer.data(), buffer.size());
  }

  void ModelCatalog::to_msgpack(const std::string& path) const {
    std::string binary_data = to_msgpack_string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open msgpack file for writing: {}", path));
    }
    file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void ModelCatalog::validate() const {
    if (models.empty()) {
      throw std::invalid_argument("models array cannot be empty");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < models.size(); ++i) {
      const auto& model = models[i];

      if (model.name.empty()) {
        throw std::invalid_argument(std::format("Model {} has an empty name", i));
      }
      if (!seen.insert(model.name).second) {
        throw std::invalid_argument(std::format("Duplicate model name '{}'", model.name));
      }
      if (!(model.size_mb > 0.0)) {
        throw std::invalid_argument(
            std::format("Model '{}' size_mb ({}) must be positive", model.name, model.size_mb));
      }
      if (!(model.inference_time_ms > 0.0)) {
        throw std::invalid_argument(std::format("Model '{}' inference_time_ms ({}) must be positive",
                                                model.name, model.inference_time_ms));
      }
      if (model.accuracy < 0.0 || model.accuracy > 1.0) {
        throw std::invalid_argument(std::format(
            "Model '{}' accuracy ({}) must be in range [0.0, 1.0]", model.name, model.accuracy));
      }
      if (model.parameters < 0) {
        throw std::invalid_argument(std::format("Model '{}' parameters ({}) must be non-negative",
                                                model.name, model.parameters));
      }
      if (model.memory_usage_mb && !(*model.memory_usage_mb > 0.0)) {
        throw std::invalid_argument(std::format("Model '{}' memory_usage_mb ({}) must be positive",
                                                model.name, *model.memory_usage_mb));
      }
    }
  }

  // ============================================================================
  // Lookup
  // ============================================================================

  const CatalogEntry* ModelCatalog::find(std::string_view name) const noexcept {
    auto it = std::ranges::find(models, name, &CatalogEntry::name);
    return it == models.end() ? nullptr : &*it;
  }

  std::optional<ModelInfo> ModelCatalog::model_info(std::string_view name) const {
    const auto* entry = find(name);
    if (!entry) return std::nullopt;
    return entry->to_model_info();
  }

  std::vector<std::string> ModelCatalog::names() const {
    auto ids = models | std::views::transform(&CatalogEntry::name);
    return {ids.begin(), ids.end()};
  }

}  // namespace xrayopt
