#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace sweeper {

// Returns a uniformly distributed index in [0, bound). bound is always > 0.
using RandomSource = std::function<std::size_t(std::size_t bound)>;

RandomSource make_random_source(uint32_t seed);

// seeded from the steady clock
RandomSource make_random_source();

} // namespace sweeper
