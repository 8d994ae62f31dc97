#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace xrayopt {

  // Canned guidance keyed by strategy name; unknown names get generic text
  [[nodiscard]] std::string_view recommendation_for(std::string_view strategy) noexcept;
  [[nodiscard]] std::vector<std::string> next_steps_for(std::string_view strategy);

  /// Size a deployment can realistically reach for the given target:
  /// 80%, 50% or 25% of the original when the target allows it, otherwise the target itself,
  /// but never below 10% of the original.
  [[nodiscard]] double achievable_size_mb(double original_size_mb, double target_size_mb) noexcept;

}  // namespace xrayopt
