/**
 * @file problem.hpp
 * @brief Validated initial-value problem definition shared by all stepping orders.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "abstep/types.hpp"

namespace abstep {

/** @brief Scalar right-hand side dy/dx = f(x, y). */
using Derivative = std::function<double(double, double)>;

/** @brief Absolute tolerance applied when checking the spacing of the initial abscissas. */
inline constexpr double kSpacingTolerance = 1e-10;

struct ProblemResult;

/**
 * @brief Derivative, equally spaced warm-up samples, step size and endpoint.
 *
 * Instances only come out of `create`, so every Problem in existence satisfies
 * x_final > x_initials.back(), step_size > 0 and uniform spacing. The sample
 * vectors may have any (matching or not) length; each stepping order checks the
 * length it needs.
 */
class Problem {
 public:
  [[nodiscard]] static ProblemResult create(Derivative func,
                                            std::vector<double> x_initials,
                                            std::vector<double> y_initials,
                                            double step_size,
                                            double x_final);

  [[nodiscard]] const Derivative& func() const { return func_; }
  [[nodiscard]] const std::vector<double>& x_initials() const { return x_initials_; }
  [[nodiscard]] const std::vector<double>& y_initials() const { return y_initials_; }
  [[nodiscard]] double step_size() const { return step_size_; }
  [[nodiscard]] double x_final() const { return x_final_; }

 private:
  Problem(Derivative func, std::vector<double> x_initials, std::vector<double> y_initials,
          double step_size, double x_final)
      : func_(std::move(func)),
        x_initials_(std::move(x_initials)),
        y_initials_(std::move(y_initials)),
        step_size_(step_size),
        x_final_(x_final) {}

  Derivative func_;
  std::vector<double> x_initials_;
  std::vector<double> y_initials_;
  double step_size_ = 0.0;
  double x_final_ = 0.0;
};

/** @brief Outcome of Problem::create; `problem` is engaged only on Success. */
struct ProblemResult {
  Status status = Status::Success;
  std::optional<Problem> problem{};
  std::string message{};
};

namespace detail {

template <class... Args>
[[nodiscard]] inline ProblemResult reject(Status status, Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  ProblemResult out{};
  out.status = status;
  out.message = oss.str();
  return out;
}

}  // namespace detail

inline ProblemResult Problem::create(Derivative func,
                                     std::vector<double> x_initials,
                                     std::vector<double> y_initials,
                                     double step_size,
                                     double x_final) {
  if (x_initials.empty()) {
    return detail::reject(Status::InsufficientInitialPoints, "at least one initial point is required");
  }
  const double x_last = x_initials.back();
  if (!(x_final > x_last) || !std::isfinite(x_final)) {
    return detail::reject(Status::InvalidRange, "final x (", x_final,
                          ") must exceed the last initial x (", x_last, ")");
  }
  if (!(step_size > 0.0) || !std::isfinite(step_size)) {
    return detail::reject(Status::InvalidStepSize, "step size must be positive, got ", step_size);
  }
  for (std::size_t i = 1; i < x_initials.size(); ++i) {
    const double dx = x_initials[i] - x_initials[i - 1];
    if (!(std::abs(dx - step_size) <= kSpacingTolerance)) {
      return detail::reject(Status::NonUniformSpacing, "x_initials[", i, "] - x_initials[", i - 1,
                            "] = ", dx, " differs from step size ", step_size);
    }
  }

  ProblemResult out{};
  out.problem = Problem(std::move(func), std::move(x_initials), std::move(y_initials), step_size, x_final);
  return out;
}

}  // namespace abstep
