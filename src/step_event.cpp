#include "step_event.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

#include "sudoku_topology.hpp"

const char* toString(StepType type) {
    switch (type) {
        case StepType::Focus: return "focus";
        case StepType::Assign: return "assign";
        case StepType::Unassign: return "unassign";
        case StepType::Guess: return "guess";
        case StepType::Backtrack: return "backtrack";
    }
    return "unknown";
}

const char* toString(AssignReason reason) {
    switch (reason) {
        case AssignReason::None: return "";
        case AssignReason::NakedSingle: return "naked single";
        case AssignReason::HiddenSingle: return "hidden single";
        case AssignReason::Guess: return "guess";
    }
    return "";
}

std::string StepEvent::toString() const {
    std::ostringstream out;
    out << ::toString(type) << " r" << SudokuTopology::rowOf(cell) + 1 << "c" << SudokuTopology::colOf(cell) + 1;
    if (type == StepType::Assign || type == StepType::Guess || type == StepType::Backtrack) {
        out << "=" << value;
    }
    if (type == StepType::Assign) {
        out << " (" << ::toString(reason) << ")";
    }
    return out.str();
}

void StepCounter::onStep(const StepEvent& event) {
    ++counts[static_cast<int>(event.type)];
    if (event.type == StepType::Guess) {
        max_depth = std::max(max_depth, ++depth);
    } else if (event.type == StepType::Backtrack) {
        --depth;
    }
}

int StepCounter::total() const {
    return std::accumulate(counts.begin(), counts.end(), 0);
}
