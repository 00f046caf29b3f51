#pragma once

#include <array>
#include <functional>
#include <string>
#include <utility>
#include <vector>

enum class StepType { Focus, Assign, Unassign, Guess, Backtrack };

enum class AssignReason { None, NakedSingle, HiddenSingle, Guess };

// One observable solver action. Cells are 0..80; value is 0 where it does not apply.
struct StepEvent {
    StepType type = StepType::Focus;
    int cell = 0;
    int value = 0;
    AssignReason reason = AssignReason::None;

    static StepEvent focus(int cell) { return {StepType::Focus, cell, 0, AssignReason::None}; }
    static StepEvent assign(int cell, int value, AssignReason reason) { return {StepType::Assign, cell, value, reason}; }
    static StepEvent unassign(int cell) { return {StepType::Unassign, cell, 0, AssignReason::None}; }
    static StepEvent guess(int cell, int value) { return {StepType::Guess, cell, value, AssignReason::None}; }
    static StepEvent backtrack(int cell, int value) { return {StepType::Backtrack, cell, value, AssignReason::None}; }

    // e.g. "assign r1c6=9 (naked single)", "guess r7c1=8"
    std::string toString() const;

    bool operator==(const StepEvent&) const = default;
};

const char* toString(StepType type);
const char* toString(AssignReason reason);

// Receives solver events synchronously, in emission order.
class StepSink {
public:
    virtual ~StepSink() = default;
    virtual void onStep(const StepEvent& event) = 0;
};

class NullStepSink final : public StepSink {
public:
    void onStep(const StepEvent&) override {}
};

class StepRecorder final : public StepSink {
public:
    void onStep(const StepEvent& event) override { recorded.push_back(event); }

    const std::vector<StepEvent>& events() const { return recorded; }
    void clear() { recorded.clear(); }

private:
    std::vector<StepEvent> recorded;
};

class CallbackStepSink final : public StepSink {
public:
    explicit CallbackStepSink(std::function<void(const StepEvent&)> callback) : callback(std::move(callback)) {}

    void onStep(const StepEvent& event) override {
        if (callback) callback(event);
    }

private:
    std::function<void(const StepEvent&)> callback;
};

// Per-type tallies. Open guesses rise on guess and fall on backtrack, so their
// peak is the deepest search branch reached.
class StepCounter final : public StepSink {
public:
    void onStep(const StepEvent& event) override;

    int count(StepType type) const { return counts[static_cast<int>(type)]; }
    int total() const;
    int maxGuessDepth() const { return max_depth; }

private:
    std::array<int, 5> counts{};
    int depth = 0;
    int max_depth = 0;
};
