#pragma once
#include <cstdint>

namespace sweeper {

enum class Phase : uint8_t { Initial = 0, Playing = 1, Lost = 2, Won = 3 };

enum class CellKind : uint8_t { Unknown = 0, Known = 1, Flagged = 2, Questioned = 3, Counted = 4 };

// Mine density: round(A^2 * a + A * b + c) for a board of area A.
// 10x10 -> 12, 10x5 -> 6, 5x5 -> 3
constexpr double DENSITY_A = 0.0002;
constexpr double DENSITY_B = 0.0938;
constexpr double DENSITY_C = 0.8937;

constexpr long long MAX_CELLS = 1LL << 16;

// cap on random draws while placing mines, per board cell
constexpr long long MAX_DRAWS_PER_CELL = 1000;

} // namespace sweeper
