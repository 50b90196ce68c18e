#include "sweeper/board.hpp"
#include "sweeper/errors.hpp"
#include <string>

using namespace sweeper;

Board::Board(int width, int height) : width_(width), height_(height) {
  if (width <= 0 || height <= 0) {
    throw InvalidDimensions("Board dimensions must be positive: " + std::to_string(width) + "x" +
                            std::to_string(height));
  }
  if (static_cast<long long>(width) * height > MAX_CELLS) {
    throw InvalidDimensions("Board too large: " + std::to_string(width) + "x" + std::to_string(height));
  }
  clear();
}

void Board::clear() {
  cells_.assign(static_cast<size_t>(width_) * height_, CellState::unknown(false));
}
