#include "sweeper/rules.hpp"
#include "sweeper/game_state.hpp"
#include <cmath>

namespace sweeper {

static constexpr int ALL_8[8][2] = {{1,0},{-1,0},{0,1},{0,-1},{1,1},{1,-1},{-1,1},{-1,-1}};

int Rules::mine_count(int width, int height) {
  const double area = static_cast<double>(width) * static_cast<double>(height);
  return static_cast<int>(std::lround(area * area * DENSITY_A + area * DENSITY_B + DENSITY_C));
}

int Rules::neighbor_count(const Board& b, int x, int y) {
  int count = 0;
  for (int i = 0; i < 8; ++i) {
    const int nx = x + ALL_8[i][0];
    const int ny = y + ALL_8[i][1];
    if (!b.in_bounds(nx, ny)) continue;
    const CellState& c = b.at(nx, ny);
    // a revealed mine (Known(true)) is not counted
    if (c.mined && c.covered()) ++count;
  }
  return count;
}

bool Rules::is_cleared(const GameState& s) {
  if (s.state() == Phase::Lost) return false;
  const Board& b = s.board();
  for (int i = 0; i < b.size(); ++i) {
    const CellState& c = b.at(i);
    if (!c.mined && c.covered()) return false;
  }
  return true;
}

} // namespace sweeper
