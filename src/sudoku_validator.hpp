#pragma once

#include <array>
#include <set>

#include "sudoku_topology.hpp"

using Grid = std::array<int, SudokuTopology::CELL_COUNT>;

struct ValidationResult {
    bool ok = true;
    std::set<int> conflicts; // every cell holding a digit repeated in one of its units
};

// Total over any grid: values outside 1..9 are treated as empty.
ValidationResult validate(const Grid& grid);

// True when every cell holds a digit and no unit repeats one.
bool isSolved(const Grid& grid);
