#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include "abstep/abstep.hpp"
#include "abstep/logging.hpp"

int main() {
  // y' = x + y, y(0) = 0 has the exact solution y = e^x - x - 1.
  auto rhs = [](double x, double y) { return x + y; };
  auto exact = [](double x) { return std::exp(x) - x - 1.0; };

  constexpr double kStep = 0.1;
  constexpr double kXFinal = 1.05;

  abstep::AdamsBashforthOptions textbook;
  textbook.normalization = abstep::CoefficientNormalization::Classical;

  for (int order = abstep::kMinOrder; order <= abstep::kMaxOrder; ++order) {
    std::vector<double> xs;
    std::vector<double> ys;
    for (int j = 0; j < order; ++j) {
      xs.push_back(kStep * j);
      ys.push_back(exact(kStep * j));
    }

    auto built = abstep::Problem::create(rhs, xs, ys, kStep, kXFinal);
    if (!built.problem) {
      abstep::log::Error("problem rejected, status=", abstep::ToString(built.status), ": ", built.message);
      return 1;
    }

    for (const auto& [label, opt] : {std::pair{"factorial", abstep::AdamsBashforthOptions{}},
                                     std::pair{"classical", textbook}}) {
      const auto res = abstep::step(order, *built.problem, opt);
      if (res.status != abstep::Status::Success) {
        abstep::log::Error("AB", order, " failed, status=", abstep::ToString(res.status), ": ", res.message);
        return 1;
      }

      const auto grid = abstep::abscissas(*built.problem, order, res.y.size());
      abstep::log::Info("AB", order, " (", label, ") steps=", res.stats.steps,
                        " rhs_evals=", res.stats.rhs_evals);
      for (std::size_t i = 0; i < res.y.size(); ++i) {
        abstep::log::Debug("  x=", grid[i], " y=", res.y[i], " exact=", exact(grid[i]));
      }
      abstep::log::Info("  y(", grid.back(), ") = ", res.y.back(),
                        " error = ", std::abs(res.y.back() - exact(grid.back())));
    }
  }

  return 0;
}
