#pragma once
#include "sweeper/cell.hpp"
#include "sweeper/game_state.hpp"
#include "sweeper/types.hpp"
#include <string>

namespace sweeper {

// UTF-8 glyphs
inline constexpr const char* GLYPH_COVERED = "\xE2\x96\xA0";  // U+25A0
inline constexpr const char* GLYPH_REVEALED = "\xE2\x96\xA1"; // U+25A1
inline constexpr const char* GLYPH_MINE = "*";
inline constexpr const char* GLYPH_FLAG = "F";
inline constexpr const char* GLYPH_QUESTION = "?";

std::string glyph(const CellState& c);

// One glyph and a space per cell, one line per row.
std::string render(const GameState& s);

const char* phase_name(Phase p);

} // namespace sweeper
