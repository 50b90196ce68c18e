#pragma once
#include "sweeper/board.hpp"
#include "sweeper/types.hpp"

namespace sweeper {

class GameState; // forward

namespace Rules {
  // density function, see types.hpp
  int mine_count(int width, int height);
  // mined cells among the up-to-8 neighbours, whatever their mark
  int neighbor_count(const Board& b, int x, int y);
  // every non-mined cell revealed; does not change the phase
  bool is_cleared(const GameState& s);
}

} // namespace sweeper
