#pragma once
#include <stdexcept>

namespace sweeper {

struct OutOfBounds : public std::out_of_range {
  using std::out_of_range::out_of_range;
};

struct InvalidDimensions : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace sweeper
