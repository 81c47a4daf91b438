/**
 * @file coefficients.hpp
 * @brief Adams-Bashforth coefficient tables for orders 2 through 5.
 */
#pragma once

#include <array>
#include <span>

#include "abstep/types.hpp"

namespace abstep {

inline constexpr int kMinOrder = 2;
inline constexpr int kMaxOrder = 5;

/**
 * @brief Integer weights of the past derivatives, most recent first.
 *
 * `factorial_denominator` is (Order - 1)!. `classical_denominator` equals the sum
 * of the weights and yields the textbook method.
 */
template <int Order>
struct TableauAB;

template <>
struct TableauAB<2> {
  static constexpr int order = 2;
  static constexpr std::array<double, order> c = {3.0, -1.0};
  static constexpr double factorial_denominator = 1.0;
  static constexpr double classical_denominator = 2.0;
};

template <>
struct TableauAB<3> {
  static constexpr int order = 3;
  static constexpr std::array<double, order> c = {23.0, -16.0, 5.0};
  static constexpr double factorial_denominator = 2.0;
  static constexpr double classical_denominator = 12.0;
};

template <>
struct TableauAB<4> {
  static constexpr int order = 4;
  static constexpr std::array<double, order> c = {55.0, -59.0, 37.0, -9.0};
  static constexpr double factorial_denominator = 6.0;
  static constexpr double classical_denominator = 24.0;
};

template <>
struct TableauAB<5> {
  static constexpr int order = 5;
  static constexpr std::array<double, order> c = {1901.0, -2774.0, 2616.0, -1274.0, 251.0};
  static constexpr double factorial_denominator = 24.0;
  static constexpr double classical_denominator = 720.0;
};

template <int Order>
[[nodiscard]] constexpr double denominator(CoefficientNormalization normalization) {
  return normalization == CoefficientNormalization::Classical ? TableauAB<Order>::classical_denominator
                                                              : TableauAB<Order>::factorial_denominator;
}

/** @brief Runtime view of one table row. */
struct CoefficientRow {
  std::span<const double> c{};
  double factorial_denominator = 0.0;
  double classical_denominator = 0.0;
};

/** @brief Look up the row for `order`; empty span when the order is unsupported. */
[[nodiscard]] constexpr CoefficientRow coefficients(int order) {
  switch (order) {
    case 2:
      return {TableauAB<2>::c, TableauAB<2>::factorial_denominator, TableauAB<2>::classical_denominator};
    case 3:
      return {TableauAB<3>::c, TableauAB<3>::factorial_denominator, TableauAB<3>::classical_denominator};
    case 4:
      return {TableauAB<4>::c, TableauAB<4>::factorial_denominator, TableauAB<4>::classical_denominator};
    case 5:
      return {TableauAB<5>::c, TableauAB<5>::factorial_denominator, TableauAB<5>::classical_denominator};
    default:
      break;
  }
  return {};
}

}  // namespace abstep
