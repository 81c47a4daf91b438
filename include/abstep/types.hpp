/**
 * @file types.hpp
 * @brief Public API enums, options, status, stats, and result containers.
 */
#pragma once

#include <string>
#include <vector>

namespace abstep {

/** @brief Terminal status returned by problem construction and stepping calls. */
enum class Status {
  Success,
  InvalidRange,
  InvalidStepSize,
  NonUniformSpacing,
  InsufficientInitialPoints,
  UnsupportedOrder,
  MaxStepsExceeded
};

/** @brief Convert Status to stable string token. */
[[nodiscard]] inline const char* ToString(Status status) {
  switch (status) {
    case Status::Success:
      return "success";
    case Status::InvalidRange:
      return "invalid_range";
    case Status::InvalidStepSize:
      return "invalid_step_size";
    case Status::NonUniformSpacing:
      return "non_uniform_spacing";
    case Status::InsufficientInitialPoints:
      return "insufficient_initial_points";
    case Status::UnsupportedOrder:
      return "unsupported_order";
    case Status::MaxStepsExceeded:
      return "max_steps_exceeded";
  }
  return "unknown";
}

/** @brief Which y-values the derivative window is evaluated against. */
enum class DerivativePairing {
  Windowed,   // f(x_window[j], y[i + j]): y-values slide with the window
  Reference   // f(x_window[j], y[j]): y-values stay on the warm-up region
};

/** @brief Denominator applied to the integer coefficient table. */
enum class CoefficientNormalization {
  Factorial,  // (order - 1)!
  Classical   // 2, 12, 24, 720
};

/** @brief Stepping configuration options. */
struct AdamsBashforthOptions {
  DerivativePairing pairing = DerivativePairing::Windowed;
  CoefficientNormalization normalization = CoefficientNormalization::Factorial;
  long long max_steps = 1000000;
};

/** @brief Work counters for one stepping call. */
struct StepStats {
  long long steps = 0;
  long long rhs_evals = 0;
};

/** @brief Trajectory of y-values; empty unless status == Success. */
struct StepResult {
  Status status = Status::Success;
  int order = 0;
  std::vector<double> y{};
  StepStats stats{};
  std::string message{};
};

}  // namespace abstep
