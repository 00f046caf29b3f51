#include "sudoku_solver.hpp"

#include <algorithm>
#include <bit> // Requires C++20
#include <utility>

/**
 * Sudoku Solver with a visible decision trace
 * * stages:
 * 1. Validation: duplicate digits in any row, column or box are rejected up front.
 * 2. Candidates: 9-bit masks per cell, seeded from the filled peers.
 * 3. Propagation: naked singles, then hidden singles, repeated to a fixed point.
 * 4. Search: branch on the cell with the fewest candidates (MRV), lowest index
 *    first on ties, digits in ascending order. Each branch works on its own copy.
 * * Every placement, guess and retreat is reported to a StepSink in the order it
 *   happens, so the same grid always yields the same trace.
 */

const char* describe(SolveError error) {
    switch (error) {
        case SolveError::None: return "Solved.";
        case SolveError::ConflictsFound: return "Conflicts found.";
        case SolveError::InvalidPuzzle: return "Invalid puzzle.";
        case SolveError::UnsolvablePuzzle: return "Unsolvable puzzle.";
        case SolveError::NoSolutionFound: return "No solution found.";
    }
    return "Unknown error.";
}

namespace {

SolveResult failure(SolveError error) {
    SolveResult result;
    result.error = error;
    return result;
}

} // namespace

SudokuSolver::SudokuSolver() : topology(SudokuTopology::instance()) {}

SolveResult SudokuSolver::solve(const Grid& input) const {
    NullStepSink sink;
    return solveWithSteps(input, sink);
}

SolveResult SudokuSolver::solveWithSteps(const Grid& input,
                                         const std::function<void(const StepEvent&)>& onStep) const {
    CallbackStepSink sink(onStep);
    return solveWithSteps(input, sink);
}

// Main entry point
SolveResult SudokuSolver::solveWithSteps(const Grid& input, StepSink& sink) const {
    ValidationResult validation = validate(input);
    if (!validation.ok) {
        SolveResult result = failure(SolveError::ConflictsFound);
        result.conflicts = std::move(validation.conflicts);
        return result;
    }

    State state;
    state.grid = input;
    SolveError error = buildCandidates(state.grid, state.candidates);
    if (error != SolveError::None) return failure(error);

    if (!propagate(state, sink)) return failure(SolveError::UnsolvablePuzzle);

    if (!isSolved(state.grid) && !search(state, sink)) {
        return failure(SolveError::NoSolutionFound);
    }

    SolveResult result;
    result.ok = true;
    result.grid = state.grid;
    return result;
}

SolveError SudokuSolver::buildCandidates(const Grid& grid, Candidates& out) const {
    if (!validate(grid).ok) return SolveError::ConflictsFound;
    if (std::any_of(grid.begin(), grid.end(), [](int v) { return v < 0 || v > 9; })) {
        return SolveError::InvalidPuzzle;
    }

    Candidates candidates;
    for (int i = 0; i < CELL_COUNT; ++i) {
        int v = grid[i];
        if (v != 0) {
            candidates[i] = digitBit(v);
            continue;
        }

        // OR together the digits already placed around the cell, then invert
        uint16_t used = 0;
        for (int p : topology.peers(i)) {
            if (grid[p] != 0) used |= digitBit(grid[p]);
        }
        candidates[i] = ~used & ALL_DIGITS;
        if (candidates[i] == 0) return SolveError::InvalidPuzzle;
    }

    out = candidates;
    return SolveError::None;
}

bool SudokuSolver::assign(State& state, int idx, int value, AssignReason reason, StepSink& sink) const {
    uint16_t bit = digitBit(value);
    state.grid[idx] = value;
    state.candidates[idx] = bit;
    sink.onStep(StepEvent::assign(idx, value, reason));

    for (int p : topology.peers(idx)) {
        if (state.grid[p] != 0) continue;
        if (state.candidates[p] & bit) {
            state.candidates[p] &= ~bit;
            if (state.candidates[p] == 0) return false; // Dead end
        }
    }
    return true;
}

bool SudokuSolver::propagate(State& state, StepSink& sink) const {
    bool changed = true;
    while (changed) {
        changed = false;
        if (!nakedSinglePass(state, sink, changed)) return false;
        if (!hiddenSinglePass(state, sink, changed)) return false;
    }
    return true;
}

// A cell with one candidate left must take it
bool SudokuSolver::nakedSinglePass(State& state, StepSink& sink, bool& changed) const {
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (state.grid[i] != 0) continue;
        uint16_t mask = state.candidates[i];
        if (std::popcount(mask) != 1) continue;

        if (!assign(state, i, std::countr_zero(mask) + 1, AssignReason::NakedSingle, sink)) return false;
        changed = true;
    }
    return true;
}

// A digit that fits only one cell of a unit must go there
bool SudokuSolver::hiddenSinglePass(State& state, StepSink& sink, bool& changed) const {
    for (const auto& unit : topology.units()) {
        // Positions are gathered once per unit, before any placement in it
        std::array<int, 10> spots{};
        std::array<int, 10> last_cell{};
        for (int idx : unit) {
            if (state.grid[idx] != 0) continue;
            uint16_t mask = state.candidates[idx];
            while (mask) {
                int val = std::countr_zero(mask) + 1;
                ++spots[val];
                last_cell[val] = idx;
                mask &= (mask - 1);
            }
        }

        for (int val = 1; val <= 9; ++val) {
            if (spots[val] != 1) continue;
            int idx = last_cell[val];
            // Already taken by another digit's hidden single in this unit,
            // so `val` has nowhere left to go
            if (state.grid[idx] != 0) return false;

            if (!assign(state, idx, val, AssignReason::HiddenSingle, sink)) return false;
            changed = true;
        }
    }
    return true;
}

// MRV: fewest candidates wins; the strict comparison keeps the lowest index on ties
int SudokuSolver::pickMrvCell(const State& state) const {
    int best_idx = -1;
    int min_candidates = 10;
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (state.grid[i] != 0) continue;
        int count = std::popcount(state.candidates[i]);
        if (count < min_candidates) {
            min_candidates = count;
            best_idx = i;
        }
    }
    return best_idx;
}

bool SudokuSolver::search(State& state, StepSink& sink) const {
    if (isSolved(state.grid)) return true;

    int cell = pickMrvCell(state);
    if (cell == -1) return false; // Filled but not valid

    sink.onStep(StepEvent::focus(cell));

    // Iterate through the bits set in the mask, lowest digit first
    uint16_t mask = state.candidates[cell];
    while (mask) {
        int val = std::countr_zero(mask) + 1;
        sink.onStep(StepEvent::guess(cell, val));

        State branch = state;
        if (assign(branch, cell, val, AssignReason::Guess, sink) && propagate(branch, sink) && search(branch, sink)) {
            state = branch;
            return true;
        }

        sink.onStep(StepEvent::unassign(cell));
        sink.onStep(StepEvent::backtrack(cell, val));

        // Clear the lowest set bit to move to the next candidate
        mask &= (mask - 1);
    }

    return false;
}
