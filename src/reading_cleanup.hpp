#pragma once

#include <array>

#include "sudoku_validator.hpp"

using Confidences = std::array<float, SudokuTopology::CELL_COUNT>;

// Gives up after this many cleared cells even if conflicts remain.
constexpr int MAX_CLEANUP_ROUNDS = 60;

/**
 * Resolves recognition mistakes that show up as duplicate digits.
 * While validate() reports conflicts, the conflicting cell read with the
 * lowest confidence (lowest index on ties) is cleared.
 *
 * @param grid Digits as read, 0 for empty cells.
 * @param confidence Per-cell confidence of the reading, same indexing as grid.
 * @return The grid with offending readings removed.
 */
Grid dropConflictingReadings(Grid grid, Confidences confidence);
