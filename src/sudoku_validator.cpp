#include "sudoku_validator.hpp"

#include <algorithm>

ValidationResult validate(const Grid& grid) {
    ValidationResult result;
    const auto& topology = SudokuTopology::instance();

    for (const auto& unit : topology.units()) {
        // digit -> how many times it appears in this unit
        std::array<int, 10> seen{};
        for (int idx : unit) {
            int v = grid[idx];
            if (v >= 1 && v <= 9) ++seen[v];
        }
        for (int idx : unit) {
            int v = grid[idx];
            if (v >= 1 && v <= 9 && seen[v] > 1) result.conflicts.insert(idx);
        }
    }

    result.ok = result.conflicts.empty();
    return result;
}

bool isSolved(const Grid& grid) {
    bool filled = std::all_of(grid.begin(), grid.end(), [](int v) { return v >= 1 && v <= 9; });
    return filled && validate(grid).ok;
}
