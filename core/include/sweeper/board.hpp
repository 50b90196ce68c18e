#pragma once
#include "sweeper/cell.hpp"
#include "sweeper/types.hpp"
#include <vector>

namespace sweeper {

class Board {
public:
  Board(int width, int height);
  int width() const { return width_; }
  int height() const { return height_; }
  int size() const { return static_cast<int>(cells_.size()); }
  void clear();

  bool in_bounds(int x, int y) const {
    return x >= 0 && x < width() && y >= 0 && y < height();
  }

  int index(int x, int y) const { return y * width_ + x; }

  CellState& at(int x, int y) { return cells_[index(x, y)]; }
  const CellState& at(int x, int y) const { return cells_[index(x, y)]; }

  // row-major linear access
  CellState& at(int i) { return cells_[i]; }
  const CellState& at(int i) const { return cells_[i]; }

private:
  int width_ = 0;
  int height_ = 0;
  std::vector<CellState> cells_;
};

} // namespace sweeper
