#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace mcsim {

// Seeded std::mt19937_64 plus the draws the planner and clearing need.
// One instance per (run seed, tick) or per planned action.
class Rng {
public:
  using Engine = std::mt19937_64;

  explicit Rng(uint64_t seed = 0) : engine_(static_cast<Engine::result_type>(seed)) {}

  // [0,1)
  double uniform01() {
    std::uniform_real_distribution<double> U01(0.0, 1.0);
    return U01(engine_);
  }

  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    return pick(engine_);
  }

  double lognormal(double mu, double sigma) {
    std::lognormal_distribution<double> dist(mu, sigma);
    return dist(engine_);
  }

  // triangular on [low, high] peaking at mode
  double triangular(double low, double high, double mode) {
    if (high <= low) return low;
    mode = std::clamp(mode, low, high);
    std::vector<double> knots{low};
    std::vector<double> density{mode == low ? 1.0 : 0.0};
    if (mode > low && mode < high) {
      knots.push_back(mode);
      density.push_back(1.0);
    }
    knots.push_back(high);
    density.push_back(mode == high ? 1.0 : 0.0);
    std::piecewise_linear_distribution<double> dist(knots.begin(), knots.end(), density.begin());
    return dist(engine_);
  }

  template <class T>
  const T& choice(const std::vector<T>& v) {
    return v[index(v.size())];
  }

  template <class T>
  void shuffle(std::vector<T>& v) {
    std::shuffle(v.begin(), v.end(), engine_);
  }

private:
  Engine engine_;
};

} // namespace mcsim
