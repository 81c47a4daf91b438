/**
 * @file eigen_api.hpp
 * @brief Eigen-first convenience wrappers for problem construction and stepping.
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "abstep/abstep.hpp"

namespace abstep::eigen {

using Vector = Eigen::VectorXd;

/** @brief Trajectory as an Eigen vector; empty unless status == Success. */
struct VectorResult {
  Status status = Status::Success;
  int order = 0;
  Vector y{};
  StepStats stats{};
  std::string message{};
};

namespace detail {

[[nodiscard]] inline std::vector<double> to_std(const Vector& v) {
  return std::vector<double>(v.data(), v.data() + v.size());
}

[[nodiscard]] inline Vector to_eigen(const std::vector<double>& v) {
  return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace detail

[[nodiscard]] inline ProblemResult make_problem(Derivative func,
                                                const Vector& x_initials,
                                                const Vector& y_initials,
                                                double step_size,
                                                double x_final) {
  return Problem::create(std::move(func), detail::to_std(x_initials), detail::to_std(y_initials), step_size,
                         x_final);
}

[[nodiscard]] inline VectorResult step(int order, const Problem& problem, AdamsBashforthOptions opt = {}) {
  StepResult res = abstep::step(order, problem, opt);
  VectorResult out{};
  out.status = res.status;
  out.order = res.order;
  out.y = detail::to_eigen(res.y);
  out.stats = res.stats;
  out.message = std::move(res.message);
  return out;
}

/** @brief Abscissas matching `result.y`, entry for entry. */
[[nodiscard]] inline Vector abscissas(const Problem& problem, const VectorResult& result) {
  return detail::to_eigen(abstep::abscissas(problem, result.order, static_cast<std::size_t>(result.y.size())));
}

}  // namespace abstep::eigen
