#include "sweeper/game_state.hpp"
#include "sweeper/errors.hpp"
#include "sweeper/rules.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sweeper {

GameState::GameState(int width, int height) : GameState(width, height, make_random_source()) {}

GameState::GameState(int width, int height, RandomSource random)
    : board_(width, height), random_(std::move(random)) {
  reset();
}

void GameState::reset() {
  const int mines = Rules::mine_count(width(), height());
  const int size = board_.size();
  // resampling below would never terminate
  if (mines >= size) {
    throw InvalidDimensions("Mine count " + std::to_string(mines) + " leaves no safe cell on a " +
                            std::to_string(width()) + "x" + std::to_string(height()) + " board");
  }
  clear();
  // far beyond what a uniform source needs at any density the board allows
  const long long max_draws = static_cast<long long>(size) * MAX_DRAWS_PER_CELL;
  long long draws = 0;
  auto draw = [&]() {
    if (++draws > max_draws) {
      throw std::runtime_error("Random source kept returning mined cells after " +
                               std::to_string(max_draws) + " draws");
    }
    const std::size_t value = random_(static_cast<std::size_t>(size));
    if (value >= static_cast<std::size_t>(size)) {
      throw OutOfBounds("Random source returned index " + std::to_string(value) + " for a board of " +
                        std::to_string(size) + " cells");
    }
    return static_cast<int>(value);
  };
  for (int placed = 0; placed < mines; ++placed) {
    int cell = draw();
    while (board_.at(cell).mined) {
      cell = draw();
    }
    board_.at(cell) = CellState::unknown(true);
  }
  total_mines_ = mines;
  remaining_ = mines;
  phase_ = Phase::Initial;
}

void GameState::clear() {
  board_.clear();
  phase_ = Phase::Initial;
}

void GameState::check_bounds(int x, int y) const {
  if (!board_.in_bounds(x, y)) {
    throw OutOfBounds("Cell (" + std::to_string(x) + "," + std::to_string(y) + ") is outside the " +
                      std::to_string(width()) + "x" + std::to_string(height()) + " board");
  }
}

CellState GameState::cell_state(int x, int y) const {
  check_bounds(x, y);
  return board_.at(x, y);
}

bool GameState::is_mined(int x, int y) const {
  check_bounds(x, y);
  const CellState& c = board_.at(x, y);
  return c == CellState::unknown(true) || c == CellState::known(true);
}

bool GameState::has_mine(int x, int y) const {
  check_bounds(x, y);
  return board_.at(x, y).mined;
}

int GameState::neighbor_count(int x, int y) const {
  check_bounds(x, y);
  return Rules::neighbor_count(board_, x, y);
}

void GameState::flag(int x, int y) {
  check_bounds(x, y);
  CellState& c = board_.at(x, y);
  if (c.kind == CellKind::Unknown || c.kind == CellKind::Questioned) {
    c = CellState::flagged(c.mined);
    if (remaining_ > 0) remaining_ -= 1;
  }
  phase_ = Phase::Playing;
}

void GameState::question(int x, int y) {
  check_bounds(x, y);
  CellState& c = board_.at(x, y);
  if (c.kind == CellKind::Unknown) {
    c = CellState::questioned(c.mined);
  } else if (c.kind == CellKind::Flagged) {
    c = CellState::questioned(c.mined);
    remaining_ += 1;
  }
  phase_ = Phase::Playing;
}

void GameState::set_unknown(int x, int y) {
  check_bounds(x, y);
  CellState& c = board_.at(x, y);
  switch (c.kind) {
    case CellKind::Flagged:
      c = CellState::unknown(c.mined);
      remaining_ += 1;
      break;
    case CellKind::Known:
    case CellKind::Questioned:
      c = CellState::unknown(c.mined);
      break;
    case CellKind::Counted:
      c = CellState::unknown(false);
      break;
    case CellKind::Unknown:
      break;
  }
}

void GameState::show_mined() {
  for (int i = 0; i < board_.size(); ++i) {
    if (board_.at(i) == CellState::unknown(true)) board_.at(i) = CellState::known(true);
  }
}

Phase GameState::uncover(int x, int y) {
  check_bounds(x, y);
  if (phase_ == Phase::Lost) return phase_;
  phase_ = Phase::Playing;

  CellState& c = board_.at(x, y);
  if (!c.covered()) return phase_;

  if (c.mined) {
    c = CellState::known(true);
    phase_ = Phase::Lost;
    return phase_;
  }

  const int count = Rules::neighbor_count(board_, x, y);
  if (count != 0) {
    c = CellState::counted(count);
  } else {
    flood_reveal(x, y);
  }
  return phase_;
}

void GameState::flood_reveal(int x, int y) {
  std::vector<std::pair<int,int>> stack;
  stack.emplace_back(x, y);
  while (!stack.empty()) {
    const auto [cx, cy] = stack.back();
    stack.pop_back();
    const int count = Rules::neighbor_count(board_, cx, cy);
    if (count != 0) {
      board_.at(cx, cy) = CellState::counted(count);
      continue;
    }
    board_.at(cx, cy) = CellState::known(false);
    for (int ny = cy - 1; ny <= cy + 1; ++ny) {
      for (int nx = cx - 1; nx <= cx + 1; ++nx) {
        if (nx == cx && ny == cy) continue;
        if (!board_.in_bounds(nx, ny)) continue;
        // marked neighbours stop the cascade
        if (board_.at(nx, ny) == CellState::unknown(false)) stack.emplace_back(nx, ny);
      }
    }
  }
}

} // namespace sweeper
