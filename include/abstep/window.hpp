/**
 * @file window.hpp
 * @brief Fixed-capacity ring buffer holding the most recent abscissas of a multistep run.
 */
#pragma once

#include <array>
#include <cstddef>

namespace abstep {

/**
 * @brief Window of the N most recent x-values, oldest at index 0.
 *
 * `slide` drops the oldest entry and appends `back() + h` in O(1) without
 * moving the remaining entries.
 */
template <std::size_t N>
class AbscissaWindow {
 public:
  static_assert(N > 0, "window must hold at least one abscissa");

  template <class Range>
  explicit AbscissaWindow(const Range& initial) {
    for (std::size_t i = 0; i < N; ++i) {
      buf_[i] = initial[i];
    }
  }

  static constexpr std::size_t size() { return N; }

  [[nodiscard]] double operator[](std::size_t j) const {
    return buf_[(head_ + j) % N];
  }

  [[nodiscard]] double back() const { return (*this)[N - 1]; }

  void slide(double h) {
    const double next = back() + h;
    buf_[head_] = next;
    head_ = (head_ + 1) % N;
  }

 private:
  std::array<double, N> buf_{};
  std::size_t head_ = 0;  // physical slot of the oldest abscissa
};

}  // namespace abstep
