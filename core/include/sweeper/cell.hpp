#pragma once
#include "sweeper/types.hpp"

namespace sweeper {

// Visible wrapper plus ground truth. count is only meaningful for Counted.
struct CellState {
  CellKind kind = CellKind::Unknown;
  bool mined = false;
  int count = 0;

  static CellState unknown(bool mined) { return CellState{CellKind::Unknown, mined, 0}; }
  static CellState known(bool mined) { return CellState{CellKind::Known, mined, 0}; }
  static CellState flagged(bool mined) { return CellState{CellKind::Flagged, mined, 0}; }
  static CellState questioned(bool mined) { return CellState{CellKind::Questioned, mined, 0}; }
  static CellState counted(int n) { return CellState{CellKind::Counted, false, n}; }

  // Unknown, Flagged or Questioned
  bool covered() const {
    return kind == CellKind::Unknown || kind == CellKind::Flagged || kind == CellKind::Questioned;
  }
};

inline bool operator==(const CellState& a, const CellState& b) {
  return a.kind == b.kind && a.mined == b.mined && a.count == b.count;
}

inline bool operator!=(const CellState& a, const CellState& b) {
  return !(a == b);
}

} // namespace sweeper
