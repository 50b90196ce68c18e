#pragma once
#include "sweeper/board.hpp"
#include "sweeper/cell.hpp"
#include "sweeper/random_source.hpp"
#include "sweeper/types.hpp"

namespace sweeper {

class GameState {
public:
  GameState(int width, int height);
  GameState(int width, int height, RandomSource random);

  // Wipes the grid and places a fresh set of mines.
  void reset();
  // Wipes the grid without placing mines. Counters are left untouched.
  void clear();

  int width() const { return board_.width(); }
  int height() const { return board_.height(); }
  Phase state() const { return phase_; }
  int remaining() const { return remaining_; }
  int total_mines() const { return total_mines_; }

  const Board& board() const { return board_; }
  Board& board() { return board_; }

  // All coordinate taking members throw OutOfBounds for cells outside the grid.
  CellState cell_state(int x, int y) const;
  // Covered-and-unmarked or detonated mine. Flagged or questioned mines report false.
  bool is_mined(int x, int y) const;
  // ground truth
  bool has_mine(int x, int y) const;
  int neighbor_count(int x, int y) const;

  void flag(int x, int y);
  void question(int x, int y);
  void set_unknown(int x, int y);
  void show_mined();
  Phase uncover(int x, int y);

private:
  void check_bounds(int x, int y) const;
  void flood_reveal(int x, int y);

  Board board_;
  RandomSource random_;
  Phase phase_ = Phase::Initial;
  int total_mines_ = 0;
  int remaining_ = 0;
};

} // namespace sweeper
