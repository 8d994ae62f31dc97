#include <algorithm>
#include <cstdlib>
#include <exception>
#include <new>
#include <optional>
#include <ranges>
#include <span>
#include <string>

#include "xrayopt.h"
#include <xrayopt_core/xrayopt.hpp>

using xrayopt::ModelCatalog;
using xrayopt::ModelInfo;

// Opaque handle layout
struct XrayOpt {
  xrayopt::XrayOpt engine;
};

namespace {

  char* str_duplicate(const std::string& str) {
    char* result = static_cast<char*>(std::malloc(str.length() + 1));
    if (result) {
      std::ranges::copy(str, result);
      result[str.length()] = '\0';
    }
    return result;
  }

  void set_error(XrayOptErrorCode* error_out, XrayOptErrorCode code) {
    if (error_out) *error_out = code;
  }

  XrayOpt* wrap(xrayopt::Result<xrayopt::XrayOpt, std::string> engine) {
    if (!engine) return nullptr;
    return new XrayOpt{std::move(engine).value()};
  }

  // Returns nullopt (and sets the error) unless json_str holds a JSON object
  std::optional<ModelInfo> parse_model_info(const char* json_str, XrayOptErrorCode* error_out) {
    auto parsed = ModelInfo::parse(json_str, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      set_error(error_out, XRAYOPT_ERROR_INVALID_JSON);
      return std::nullopt;
    }
    return parsed;
  }

  char* emit(const nlohmann::json& j, XrayOptErrorCode* error_out) {
    char* out = str_duplicate(j.dump());
    if (!out) set_error(error_out, XRAYOPT_ERROR_ALLOCATION_FAILED);
    return out;
  }

  // Shared argument checks and exception mapping for the JSON entry points
  template <typename Fn> char* guarded(XrayOpt* handle, const void* arg, XrayOptErrorCode* error_out,
                                       Fn&& fn) {
    set_error(error_out, XRAYOPT_OK);

    if (!handle) {
      set_error(error_out, XRAYOPT_ERROR_NULL_HANDLE);
      return nullptr;
    }
    if (!arg) {
      set_error(error_out, XRAYOPT_ERROR_NULL_ARGUMENT);
      return nullptr;
    }

    try {
      return fn(handle->engine);
    } catch (const std::bad_alloc&) {
      set_error(error_out, XRAYOPT_ERROR_ALLOCATION_FAILED);
      return nullptr;
    } catch (const std::exception&) {
      set_error(error_out, XRAYOPT_ERROR_INTERNAL);
      return nullptr;
    }
  }

}  // namespace

// C API implementation
extern "C" {

XrayOpt* xrayopt_create(void) {
  try {
    return wrap(xrayopt::XrayOpt::from_builtin());
  } catch (const std::exception&) {
    return nullptr;
  }
}

XrayOpt* xrayopt_create_from_catalog(const char* catalog_path) {
  if (!catalog_path) return nullptr;
  try {
    return wrap(xrayopt::XrayOpt::from_catalog(ModelCatalog::from_json(catalog_path)));
  } catch (const std::exception&) {
    return nullptr;
  }
}

XrayOpt* xrayopt_create_from_catalog_json(const char* json_str) {
  if (!json_str) return nullptr;
  try {
    return wrap(xrayopt::XrayOpt::from_catalog(ModelCatalog::from_json_string(json_str)));
  } catch (const std::exception&) {
    return nullptr;
  }
}

XrayOpt* xrayopt_create_from_catalog_msgpack(const char* path) {
  if (!path) return nullptr;
  try {
    return wrap(xrayopt::XrayOpt::from_catalog(ModelCatalog::from_msgpack(path)));
  } catch (const std::exception&) {
    return nullptr;
  }
}

void xrayopt_destroy(XrayOpt* handle) { delete handle; }

char* xrayopt_optimize_json(XrayOpt* handle, const char* model_info_json,
                            const char* optimization_type, double target_size_mb,
                            XrayOptErrorCode* error_out) {
  if (handle && model_info_json && !optimization_type) {
    set_error(error_out, XRAYOPT_ERROR_NULL_ARGUMENT);
    return nullptr;
  }
  return guarded(handle, model_info_json, error_out, [&](const xrayopt::XrayOpt& engine) -> char* {
    auto info = parse_model_info(model_info_json, error_out);
    if (!info) return nullptr;
    auto result = engine.optimizer().optimize_model(*info, optimization_type, target_size_mb);
    return emit(result, error_out);
  });
}

char* xrayopt_compare_json(XrayOpt* handle, const char* model_info_json, double target_size_mb,
                           XrayOptErrorCode* error_out) {
  return guarded(handle, model_info_json, error_out, [&](const xrayopt::XrayOpt& engine) -> char* {
    auto info = parse_model_info(model_info_json, error_out);
    if (!info) return nullptr;
    auto comparison = engine.optimizer().compare_strategies(*info, target_size_mb);
    if (!comparison) {
      set_error(error_out, XRAYOPT_ERROR_OPERATION_FAILED);
      return nullptr;
    }
    return emit(*comparison, error_out);
  });
}

char* xrayopt_report_json(XrayOpt* handle, const char* model_info_json, double target_size_mb,
                          XrayOptErrorCode* error_out) {
  return guarded(handle, model_info_json, error_out, [&](const xrayopt::XrayOpt& engine) -> char* {
    auto info = parse_model_info(model_info_json, error_out);
    if (!info) return nullptr;
    auto report = engine.optimizer().build_report(*info, target_size_mb);
    if (!report) {
      set_error(error_out, XRAYOPT_ERROR_OPERATION_FAILED);
      return nullptr;
    }
    return emit(*report, error_out);
  });
}

char* xrayopt_report_for_model_json(XrayOpt* handle, const char* model_type,
                                    double target_size_mb, XrayOptErrorCode* error_out) {
  return guarded(handle, model_type, error_out, [&](const xrayopt::XrayOpt& engine) -> char* {
    if (!engine.catalog().contains(model_type)) {
      set_error(error_out, XRAYOPT_ERROR_MODEL_NOT_FOUND);
      return nullptr;
    }
    auto report = engine.report(model_type, target_size_mb);
    if (!report) {
      set_error(error_out, XRAYOPT_ERROR_OPERATION_FAILED);
      return nullptr;
    }
    return emit(*report, error_out);
  });
}

XrayOptSummary* xrayopt_summarize_model(XrayOpt* handle, const char* model_type,
                                        double target_size_mb, XrayOptErrorCode* error_out) {
  set_error(error_out, XRAYOPT_OK);

  if (!handle) {
    set_error(error_out, XRAYOPT_ERROR_NULL_HANDLE);
    return nullptr;
  }
  if (!model_type) {
    set_error(error_out, XRAYOPT_ERROR_NULL_ARGUMENT);
    return nullptr;
  }

  try {
    if (!handle->engine.catalog().contains(model_type)) {
      set_error(error_out, XRAYOPT_ERROR_MODEL_NOT_FOUND);
      return nullptr;
    }

    auto report = handle->engine.report(model_type, target_size_mb);
    if (!report) {
      set_error(error_out, XRAYOPT_ERROR_OPERATION_FAILED);
      return nullptr;
    }

    auto* summary = static_cast<XrayOptSummary*>(std::malloc(sizeof(XrayOptSummary)));
    if (!summary) {
      set_error(error_out, XRAYOPT_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    summary->best_strategy = str_duplicate(report->summary.best_strategy);
    summary->recommendation = str_duplicate(report->summary.recommendation);
    if (!summary->best_strategy || !summary->recommendation) {
      std::free(summary->best_strategy);
      std::free(summary->recommendation);
      std::free(summary);
      set_error(error_out, XRAYOPT_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    summary->achievable_size_mb = report->summary.achievable_size_mb;
    summary->target_size_mb = report->target_size_mb;
    summary->total_strategies_tested = report->summary.total_strategies_tested;
    return summary;
  } catch (const std::exception&) {
    set_error(error_out, XRAYOPT_ERROR_INTERNAL);
    return nullptr;
  }
}

void xrayopt_summary_free(XrayOptSummary* summary) {
  if (!summary) return;
  std::free(summary->best_strategy);
  std::free(summary->recommendation);
  std::free(summary);
}

char** xrayopt_get_available_models(XrayOpt* handle, size_t* count) {
  if (count) *count = 0;
  if (!handle || !count) return nullptr;

  try {
    auto names = handle->engine.available_models();
    if (names.empty()) return nullptr;

    auto* out = static_cast<char**>(std::malloc(sizeof(char*) * names.size()));
    if (!out) return nullptr;

    for (size_t i = 0; i < names.size(); ++i) {
      out[i] = str_duplicate(names[i]);
      if (!out[i]) {
        xrayopt_string_array_free(out, i);
        return nullptr;
      }
    }

    *count = names.size();
    return out;
  } catch (const std::exception&) {
    return nullptr;
  }
}

void xrayopt_string_free(char* str) { std::free(str); }

void xrayopt_string_array_free(char** strings, size_t count) {
  if (!strings) return;
  std::ranges::for_each(std::span(strings, count), [](char* str) { std::free(str); });
  std::free(strings);
}

}  // extern "C"
