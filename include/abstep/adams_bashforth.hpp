/**
 * @file adams_bashforth.hpp
 * @brief Fixed-step explicit Adams-Bashforth integrators of order 2 through 5.
 */
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "abstep/coefficients.hpp"
#include "abstep/problem.hpp"
#include "abstep/types.hpp"
#include "abstep/window.hpp"

namespace abstep {

namespace detail {

template <class... Args>
[[nodiscard]] inline StepResult fail(Status status, int order, Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  StepResult out{};
  out.status = status;
  out.order = order;
  out.message = oss.str();
  return out;
}

}  // namespace detail

/**
 * @brief Extend the warm-up samples of `problem` to x_final with the order-`Order` method.
 *
 * The problem must carry exactly `Order` initial points. The result holds the
 * warm-up y-values followed by one value per step, n = floor((x_final - x[Order-1]) / h).
 * Each step evaluates the derivative on the abscissa window and combines the
 * evaluations, newest first, with the tableau weights in a single ordered sum.
 */
template <int Order>
[[nodiscard]] StepResult integrate_ab(const Problem& problem, AdamsBashforthOptions opt = {}) {
  using Tableau = TableauAB<Order>;
  constexpr std::size_t k = static_cast<std::size_t>(Order);

  const auto& xs = problem.x_initials();
  const auto& ys = problem.y_initials();
  if (xs.size() != k || ys.size() != k) {
    return detail::fail(Status::InsufficientInitialPoints, Order,
                        "insufficient initial points: order ", Order, " requires exactly ", Order,
                        " x/y samples, got ", xs.size(), "/", ys.size());
  }

  const double h = problem.step_size();
  const double span = (problem.x_final() - xs[k - 1]) / h;
  if (!(span < static_cast<double>(opt.max_steps) + 1.0)) {
    return detail::fail(Status::MaxStepsExceeded, Order, "step count ", std::floor(span),
                        " exceeds max_steps ", opt.max_steps);
  }
  const auto n = static_cast<std::size_t>(std::floor(span));

  StepResult out{};
  out.order = Order;
  out.y.assign(k + n, 0.0);
  for (std::size_t j = 0; j < k; ++j) {
    out.y[j] = ys[j];
  }

  const auto& f = problem.func();
  const double scale = h / denominator<Order>(opt.normalization);
  const bool windowed = opt.pairing == DerivativePairing::Windowed;

  AbscissaWindow<k> window(xs);
  std::array<double, k> f_vals{};
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t base = windowed ? i : 0;
    for (std::size_t j = 0; j < k; ++j) {
      f_vals[j] = f(window[j], out.y[base + j]);
    }

    double acc = 0.0;
    for (std::size_t j = 0; j < k; ++j) {
      acc += Tableau::c[j] * f_vals[k - 1 - j];
    }
    out.y[k + i] = out.y[k + i - 1] + scale * acc;

    window.slide(h);
  }

  out.stats.steps = static_cast<long long>(n);
  out.stats.rhs_evals = static_cast<long long>(n * k);
  return out;
}

[[nodiscard]] inline StepResult step_2(const Problem& problem, AdamsBashforthOptions opt = {}) {
  return integrate_ab<2>(problem, opt);
}

[[nodiscard]] inline StepResult step_3(const Problem& problem, AdamsBashforthOptions opt = {}) {
  return integrate_ab<3>(problem, opt);
}

[[nodiscard]] inline StepResult step_4(const Problem& problem, AdamsBashforthOptions opt = {}) {
  return integrate_ab<4>(problem, opt);
}

[[nodiscard]] inline StepResult step_5(const Problem& problem, AdamsBashforthOptions opt = {}) {
  return integrate_ab<5>(problem, opt);
}

/** @brief Run the method selected at runtime; orders outside [2, 5] are rejected. */
[[nodiscard]] inline StepResult step(int order, const Problem& problem, AdamsBashforthOptions opt = {}) {
  switch (order) {
    case 2:
      return step_2(problem, opt);
    case 3:
      return step_3(problem, opt);
    case 4:
      return step_4(problem, opt);
    case 5:
      return step_5(problem, opt);
    default:
      break;
  }
  return detail::fail(Status::UnsupportedOrder, order, "unsupported order ", order, ", expected ",
                      kMinOrder, "..", kMaxOrder);
}

/**
 * @brief Abscissa of each of the first `count` entries of an order-`order` trajectory.
 *
 * Warm-up entries reuse x_initials; later entries repeat the `+ step_size` slide of
 * the stepping loop, so the values match the window bit for bit. Returns an empty
 * vector when the problem has fewer than `order` initial points.
 */
[[nodiscard]] inline std::vector<double> abscissas(const Problem& problem, int order, std::size_t count) {
  const auto& xs = problem.x_initials();
  if (order <= 0 || xs.size() < static_cast<std::size_t>(order)) {
    return {};
  }

  const auto k = static_cast<std::size_t>(order);
  std::vector<double> out(count, 0.0);
  for (std::size_t i = 0; i < count; ++i) {
    out[i] = (i < k) ? xs[i] : out[i - 1] + problem.step_size();
  }
  return out;
}

}  // namespace abstep
