#pragma once

#include <random>

namespace asteroids {

using Rng = std::mt19937;

// Uniform integer in [lo, hi).
inline int random_int(Rng& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi - 1);
    return dist(rng);
}

// Uniform real in [lo, hi).
inline double random_real(Rng& rng, double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

}  // namespace asteroids
