#ifndef XRAYOPT_H
#define XRAYOPT_H

#include <stddef.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef XRAYOPT_C_EXPORTS
#    define XRAYOPT_API __declspec(dllexport)
#  else
#    define XRAYOPT_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define XRAYOPT_API __attribute__((visibility("default")))
#  else
#    define XRAYOPT_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Opaque handle to an optimizer bound to a model catalog
 */
typedef struct XrayOpt XrayOpt;

/**
 * Condensed optimization report
 */
typedef struct {
  char* best_strategy;         /**< Winning strategy name (freed by xrayopt_summary_free) */
  char* recommendation;        /**< Canned recommendation for the winning strategy */
  double achievable_size_mb;   /**< Estimated reachable model size */
  double target_size_mb;       /**< Target the report was computed for */
  int total_strategies_tested; /**< Number of strategies evaluated */
} XrayOptSummary;

/**
 * Error codes for xrayopt operations
 */
typedef enum {
  XRAYOPT_OK = 0,
  XRAYOPT_ERROR_NULL_HANDLE,
  XRAYOPT_ERROR_NULL_ARGUMENT,
  XRAYOPT_ERROR_INVALID_JSON,
  XRAYOPT_ERROR_MODEL_NOT_FOUND,
  XRAYOPT_ERROR_OPERATION_FAILED,
  XRAYOPT_ERROR_ALLOCATION_FAILED,
  XRAYOPT_ERROR_INTERNAL
} XrayOptErrorCode;

/**
 * Create an optimizer over the built-in model catalog with default settings
 * @return Handle, or NULL on error
 */
XRAYOPT_API XrayOpt* xrayopt_create(void);

/**
 * Create an optimizer from a JSON catalog file
 * @param catalog_path Path to the catalog file
 * @return Handle, or NULL on error
 */
XRAYOPT_API XrayOpt* xrayopt_create_from_catalog(const char* catalog_path);

/**
 * Create an optimizer from a JSON catalog string
 * @param json_str Catalog JSON
 * @return Handle, or NULL on error
 */
XRAYOPT_API XrayOpt* xrayopt_create_from_catalog_json(const char* json_str);

/**
 * Create an optimizer from a MessagePack catalog file
 * @param path Path to the binary catalog
 * @return Handle, or NULL on error
 */
XRAYOPT_API XrayOpt* xrayopt_create_from_catalog_msgpack(const char* path);

/**
 * Destroy an optimizer and free its resources
 * @param handle Optimizer handle
 */
XRAYOPT_API void xrayopt_destroy(XrayOpt* handle);

/**
 * Run one strategy on a caller-described model
 * @param handle Optimizer handle
 * @param model_info_json JSON object with any of size_mb, inference_time_ms, accuracy,
 *                        memory_usage_mb, parameters
 * @param optimization_type pruning, quantization, distillation or optimization
 * @param target_size_mb Target deployment size in MB
 * @param error_out Optional error code output (can be NULL)
 * @return Strategy result JSON (caller must free with xrayopt_string_free). An unknown
 *         optimization_type still returns a result carrying an "error" field.
 */
XRAYOPT_API char* xrayopt_optimize_json(XrayOpt* handle, const char* model_info_json,
                                        const char* optimization_type, double target_size_mb,
                                        XrayOptErrorCode* error_out);

/**
 * Compare all strategies on a caller-described model
 * @return Comparison JSON (caller must free with xrayopt_string_free), or NULL on error
 */
XRAYOPT_API char* xrayopt_compare_json(XrayOpt* handle, const char* model_info_json,
                                       double target_size_mb, XrayOptErrorCode* error_out);

/**
 * Full optimization report for a caller-described model
 * @return Report JSON (caller must free with xrayopt_string_free), or NULL on error
 */
XRAYOPT_API char* xrayopt_report_json(XrayOpt* handle, const char* model_info_json,
                                      double target_size_mb, XrayOptErrorCode* error_out);

/**
 * Full optimization report for a catalog model
 * @param model_type Catalog model name, e.g. "resnet50"
 * @return Report JSON (caller must free with xrayopt_string_free), or NULL on error
 */
XRAYOPT_API char* xrayopt_report_for_model_json(XrayOpt* handle, const char* model_type,
                                                double target_size_mb,
                                                XrayOptErrorCode* error_out);

/**
 * Condensed report for a catalog model
 * @return Summary (caller must free with xrayopt_summary_free), or NULL on error
 */
XRAYOPT_API XrayOptSummary* xrayopt_summarize_model(XrayOpt* handle, const char* model_type,
                                                    double target_size_mb,
                                                    XrayOptErrorCode* error_out);

/**
 * Free a summary
 * @param summary Summary to free
 */
XRAYOPT_API void xrayopt_summary_free(XrayOptSummary* summary);

/**
 * Get catalog model names
 * @param handle Optimizer handle
 * @param count Output parameter for number of models
 * @return Array of model names (free with xrayopt_string_array_free)
 */
XRAYOPT_API char** xrayopt_get_available_models(XrayOpt* handle, size_t* count);

/**
 * Free a string returned by the API
 * @param str String to free
 */
XRAYOPT_API void xrayopt_string_free(char* str);

/**
 * Free an array of strings
 * @param strings Array to free
 * @param count Number of strings in array
 */
XRAYOPT_API void xrayopt_string_array_free(char** strings, size_t count);

#ifdef __cplusplus
}
#endif

#endif /* XRAYOPT_H */
