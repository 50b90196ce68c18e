#include "sweeper/text_view.hpp"
#include <sstream>

namespace sweeper {

std::string glyph(const CellState& c) {
  switch (c.kind) {
    case CellKind::Unknown: return GLYPH_COVERED;
    case CellKind::Known: return c.mined ? GLYPH_MINE : GLYPH_REVEALED;
    case CellKind::Counted: return std::string(1, static_cast<char>('0' + c.count));
    case CellKind::Flagged: return GLYPH_FLAG;
    case CellKind::Questioned: return GLYPH_QUESTION;
  }
  return GLYPH_COVERED;
}

std::string render(const GameState& s) {
  std::ostringstream out;
  const Board& b = s.board();
  for (int y = 0; y < b.height(); ++y) {
    for (int x = 0; x < b.width(); ++x) {
      out << glyph(b.at(x, y)) << ' ';
    }
    out << '\n';
  }
  return out.str();
}

const char* phase_name(Phase p) {
  switch (p) {
    case Phase::Initial: return "initial";
    case Phase::Playing: return "playing";
    case Phase::Lost: return "lost";
    case Phase::Won: return "won";
  }
  return "?";
}

} // namespace sweeper
