#include "sweeper/random_source.hpp"
#include <chrono>
#include <random>

namespace sweeper {

RandomSource make_random_source(uint32_t seed) {
  return [rng = std::mt19937(seed)](std::size_t bound) mutable {
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    return dist(rng);
  };
}

RandomSource make_random_source() {
  return make_random_source(
      static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
}

} // namespace sweeper
