#include <cmath>
#include <cstddef>

#include <Eigen/Core>

#include "abstep/eigen_api.hpp"
#include "abstep/logging.hpp"

namespace {

using Vec = abstep::eigen::Vector;

int TestEigenStepScenario() {
  Vec x0(3);
  x0 << 0.0, 0.2, 0.4;
  Vec y0(3);
  y0 << 0.0, 0.2, 1.0;

  const auto built = abstep::eigen::make_problem([](double x, double y) { return x + y; }, x0, y0, 0.2, 1.0);
  if (built.status != abstep::Status::Success) {
    abstep::log::Error("eigen make_problem failed: ", built.message);
    return 1;
  }

  const auto res = abstep::eigen::step(3, *built.problem);
  if (res.status != abstep::Status::Success || res.y.size() != 5) {
    abstep::log::Error("eigen step failed, status=", abstep::ToString(res.status));
    return 1;
  }

  Vec expected(5);
  expected << 0.0, 0.2, 1.0, 3.58, 11.154;
  if ((res.y - expected).cwiseAbs().maxCoeff() > 1e-11) {
    abstep::log::Error("eigen trajectory mismatch");
    return 1;
  }
  if (res.y.head(3) != y0) {
    abstep::log::Error("eigen warm-up region altered");
    return 1;
  }

  const Vec xs = abstep::eigen::abscissas(*built.problem, res);
  if (xs.size() != res.y.size() || std::abs(xs(4) - 0.8) > 1e-12) {
    abstep::log::Error("eigen abscissas mismatch");
    return 1;
  }
  return 0;
}

int TestEigenMatchesStdApi() {
  Vec x0 = Vec::LinSpaced(4, 0.0, 0.3);
  Vec y0 = x0.array().exp().matrix();

  auto built = abstep::eigen::make_problem([](double, double y) { return -2.0 * y; }, x0, y0, 0.1, 2.0);
  if (!built.problem) {
    abstep::log::Error("eigen make_problem rejected LinSpaced samples: ", built.message);
    return 1;
  }

  const auto via_eigen = abstep::eigen::step(4, *built.problem);
  const auto via_std = abstep::step_4(*built.problem);
  if (via_std.status != abstep::Status::Success ||
      static_cast<std::size_t>(via_eigen.y.size()) != via_std.y.size()) {
    abstep::log::Error("eigen/std length mismatch");
    return 1;
  }
  for (Eigen::Index i = 0; i < via_eigen.y.size(); ++i) {
    if (via_eigen.y(i) != via_std.y[static_cast<std::size_t>(i)]) {
      abstep::log::Error("eigen/std value mismatch at ", i);
      return 1;
    }
  }
  return 0;
}

int TestEigenFailures() {
  Vec x0(3);
  x0 << 0.0, 0.2, 0.41;
  Vec y0 = Vec::Zero(3);
  const auto misspaced = abstep::eigen::make_problem([](double, double) { return 0.0; }, x0, y0, 0.2, 1.0);
  if (misspaced.status != abstep::Status::NonUniformSpacing) {
    abstep::log::Error("expected NonUniformSpacing");
    return 1;
  }

  x0 << 0.0, 0.2, 0.4;
  const auto built = abstep::eigen::make_problem([](double, double) { return 0.0; }, x0, y0, 0.2, 1.0);
  if (!built.problem) {
    return 1;
  }
  const auto res = abstep::eigen::step(2, *built.problem);
  if (res.status != abstep::Status::InsufficientInitialPoints || res.y.size() != 0) {
    abstep::log::Error("expected InsufficientInitialPoints with an empty vector");
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  if (TestEigenStepScenario() != 0) {
    return 1;
  }
  if (TestEigenMatchesStdApi() != 0) {
    return 1;
  }
  if (TestEigenFailures() != 0) {
    return 1;
  }
  return 0;
}
