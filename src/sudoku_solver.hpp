#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <set>

#include "step_event.hpp"
#include "sudoku_topology.hpp"
#include "sudoku_validator.hpp"

enum class SolveError {
    None,
    ConflictsFound,   // the input repeats a digit inside a unit
    InvalidPuzzle,    // an empty cell has no legal digit before any deduction
    UnsolvablePuzzle, // deduction alone reaches a contradiction
    NoSolutionFound   // the search tried every branch
};

const char* describe(SolveError error);

struct SolveResult {
    bool ok = false;
    Grid grid{};
    SolveError error = SolveError::None;
    std::set<int> conflicts; // filled only for ConflictsFound
};

// Constraint propagation (naked and hidden singles) followed by MRV-guided
// backtracking. Holds no per-solve state, so one instance can serve any number
// of solves, including concurrent ones.
class SudokuSolver {
public:
    static constexpr int N = SudokuTopology::N;
    static constexpr int CELL_COUNT = SudokuTopology::CELL_COUNT;
    static constexpr uint16_t ALL_DIGITS = 0x1FF;

    // Bit (v - 1) set means digit v is still legal for the cell.
    using Candidates = std::array<uint16_t, CELL_COUNT>;

    // A search branch. Copying it is the whole cost of cloning a branch.
    struct State {
        Grid grid{};
        Candidates candidates{};
    };

    SudokuSolver();

    SolveResult solve(const Grid& input) const;
    SolveResult solveWithSteps(const Grid& input, StepSink& sink) const;
    SolveResult solveWithSteps(const Grid& input, const std::function<void(const StepEvent&)>& onStep) const;

    // Returns SolveError::None and fills `out` on success; ConflictsFound or
    // InvalidPuzzle otherwise, leaving `out` untouched.
    SolveError buildCandidates(const Grid& grid, Candidates& out) const;

    // Runs naked-single and hidden-single passes until neither changes the state.
    // A false return means contradiction; the state must then be discarded.
    bool propagate(State& state, StepSink& sink) const;

    // Places `value`, emits the assign event, and strips `value` from every
    // unresolved peer. False if a peer runs out of candidates.
    bool assign(State& state, int idx, int value, AssignReason reason, StepSink& sink) const;

    // Depth-first search over `state`. On success `state` holds the solution.
    bool search(State& state, StepSink& sink) const;

    static uint16_t digitBit(int value) { return static_cast<uint16_t>(1u << (value - 1)); }

private:
    const SudokuTopology& topology;

    int pickMrvCell(const State& state) const;
    bool nakedSinglePass(State& state, StepSink& sink, bool& changed) const;
    bool hiddenSinglePass(State& state, StepSink& sink, bool& changed) const;
};
