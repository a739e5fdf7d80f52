#pragma once

#include <chrono>

namespace arbor {

/// Bounds how long a context may stay exploratory.
/// Tracks wall-clock time and iteration count; either one running out
/// exhausts the budget.
class BudgetManager {
public:
    BudgetManager(double max_seconds, int max_iterations)
        : max_seconds_(max_seconds), max_iterations_(max_iterations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        iterations_ = 0;
    }

    void recordIteration() { iterations_++; }

    bool canContinue() const {
        return !isIterationExhausted() && !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int iterations() const { return iterations_; }
    int maxIterations() const { return max_iterations_; }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }
    bool isIterationExhausted() const { return max_iterations_ > 0 && iterations_ >= max_iterations_; }

private:
    double max_seconds_;     // <= 0 disables the time limit
    int max_iterations_;     // <= 0 disables the iteration limit
    int iterations_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace arbor
