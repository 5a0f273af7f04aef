#pragma once

#include <chrono>
#include <cstdint>

namespace rebut {

/// Bounds the complete-extension search by step count and wall-clock time.
/// A limit of 0 disables that bound. Check canContinue() before
/// recordStep(), so a limit of N admits exactly N steps.
class EnumerationBudget {
public:
    EnumerationBudget(double max_seconds, uint64_t max_steps)
        : max_seconds_(max_seconds), max_steps_(max_steps) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        steps_ = 0;
    }

    void recordStep() { steps_++; }

    bool canContinue() const {
        if (isStepExhausted()) return false;
        return !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    uint64_t steps() const { return steps_; }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }
    bool isStepExhausted() const { return max_steps_ > 0 && steps_ >= max_steps_; }

private:
    double max_seconds_;
    uint64_t max_steps_;
    uint64_t steps_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace rebut
