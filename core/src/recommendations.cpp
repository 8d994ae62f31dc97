#include <algorithm>
#include <xrayopt_core/recommendations.hpp>

namespace xrayopt {

  std::string_view recommendation_for(std::string_view strategy) noexcept {
    if (strategy == "pruning") {
      return "Pruning is recommended for significant size reduction with minimal accuracy loss. "
             "Best for edge deployment.";
    }
    if (strategy == "quantization") {
      return "Quantization provides good balance of size reduction and speed improvement. "
             "Best for general deployment.";
    }
    if (strategy == "distillation") {
      return "Knowledge distillation creates a smaller student model. "
             "Best when you have a large teacher model.";
    }
    if (strategy == "optimization") {
      return "Graph optimization provides moderate improvements without accuracy loss. "
             "Best for production systems.";
    }
    return "Consider the trade-offs between size, speed, and accuracy.";
  }

  std::vector<std::string> next_steps_for(std::string_view strategy) {
    if (strategy == "pruning") {
      return {"Implement structured pruning to remove entire filters",
              "Fine-tune the pruned model to recover accuracy",
              "Validate performance on test dataset", "Deploy and monitor model performance"};
    }
    if (strategy == "quantization") {
      return {"Convert model to quantized format (int8/int16)",
              "Validate accuracy on test dataset", "Optimize quantization parameters",
              "Deploy quantized model and monitor performance"};
    }
    if (strategy == "distillation") {
      return {"Train student model using teacher model outputs",
              "Validate student model performance", "Compare student vs teacher model metrics",
              "Deploy student model and monitor performance"};
    }
    if (strategy == "optimization") {
      return {"Apply graph optimization techniques", "Optimize model execution graph",
              "Validate optimized model performance",
              "Deploy optimized model and monitor performance"};
    }
    return {"Implement optimization strategy", "Validate performance", "Deploy model"};
  }

  double achievable_size_mb(double original_size_mb, double target_size_mb) noexcept {
    if (target_size_mb >= original_size_mb * 0.8) return original_size_mb * 0.8;
    if (target_size_mb >= original_size_mb * 0.5) return original_size_mb * 0.5;
    if (target_size_mb >= original_size_mb * 0.25) return original_size_mb * 0.25;
    return std::max(target_size_mb, original_size_mb * 0.1);
  }

}  // namespace xrayopt
