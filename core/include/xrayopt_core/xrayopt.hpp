#pragma once
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "catalog.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "optimizer.hpp"
#include "recommendations.hpp"
#include "report.hpp"
#include "result.hpp"
#include "scorer.hpp"
#include "strategy.hpp"

namespace xrayopt {

  /// Entry point for the screening service: resolves a catalog model by name and runs the
  /// optimizer on it. Every operation reports failure through Result instead of throwing.
  class XrayOpt {
  public:
    static Result<XrayOpt, std::string> from_catalog(ModelCatalog catalog,
                                                     OptimizerConfig config = {}) noexcept {
      try {
        catalog.validate();
        XrayOpt engine(std::move(catalog), ModelOptimizer(std::move(config)));
        return engine;
      } catch (const std::exception& e) {
        return Unexpected(std::string(e.what()));
      }
    }

    static Result<XrayOpt, std::string> from_builtin(OptimizerConfig config = {}) noexcept {
      try {
        return from_catalog(ModelCatalog::builtin(), std::move(config));
      } catch (const std::exception& e) {
        return Unexpected(std::string(e.what()));
      }
    }

    XrayOpt(XrayOpt&&) = default;
    XrayOpt& operator=(XrayOpt&&) = default;
    XrayOpt(const XrayOpt&) = delete;
    XrayOpt& operator=(const XrayOpt&) = delete;

    [[nodiscard]] Result<StrategyResult, std::string> optimize(
        std::string_view model_type, std::string_view optimization_type,
        std::optional<double> target_size_mb = std::nullopt) const noexcept {
      try {
        auto info = lookup(model_type);
        if (!info) return Unexpected(not_found(model_type));
        return optimizer_.optimize_model(*info, optimization_type, target_size_mb);
      } catch (const std::exception& e) {
        return Unexpected(std::string(e.what()));
      }
    }

    [[nodiscard]] Result<ComparisonReport, std::string> compare(
        std::string_view model_type, std::optional<double> target_size_mb = std::nullopt) const noexcept {
      try {
        auto info = lookup(model_type);
        if (!info) return Unexpected(not_found(model_type));
        return optimizer_.compare_strategies(*info, target_size_mb);
      } catch (const std::exception& e) {
        return Unexpected(std::string(e.what()));
      }
    }

    [[nodiscard]] Result<OptimizationReport, std::string> report(
        std::string_view model_type, std::optional<double> target_size_mb = std::nullopt) const noexcept {
      try {
        auto info = lookup(model_type);
        if (!info) return Unexpected(not_found(model_type));
        return optimizer_.build_report(*info, target_size_mb);
      } catch (const std::exception& e) {
        return Unexpected(std::string(e.what()));
      }
    }

    // Empty model_type selects the configured default model
    [[nodiscard]] std::optional<ModelInfo> model_info(std::string_view model_type) const {
      return lookup(model_type);
    }

    [[nodiscard]] std::vector<std::string> available_models() const { return catalog_.names(); }

    [[nodiscard]] const ModelCatalog& catalog() const noexcept { return catalog_; }
    [[nodiscard]] const ModelOptimizer& optimizer() const noexcept { return optimizer_; }

  private:
    XrayOpt(ModelCatalog catalog, ModelOptimizer optimizer)
        : catalog_(std::move(catalog)), optimizer_(std::move(optimizer)) {}

    [[nodiscard]] std::optional<ModelInfo> lookup(std::string_view model_type) const {
      if (model_type.empty()) model_type = optimizer_.config().default_model;
      return catalog_.model_info(model_type);
    }

    [[nodiscard]] static std::string not_found(std::string_view model_type) {
      return std::format("Model {} not found", model_type);
    }

    ModelCatalog catalog_;
    ModelOptimizer optimizer_;
  };

}  // namespace xrayopt
