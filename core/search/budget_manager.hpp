#pragma once

#include "search/search_state.hpp"

#include <chrono>

namespace puzlib {

/// Expansion and wall-clock limits of a single search call, taken from
/// SearchConfig. A limit of zero means unlimited.
///
/// The clock is only read every kClockStride expansions, so a time limit
/// may be overshot by up to that many expansions.
class BudgetManager {
public:
    enum class Limit { NONE, EXPANSIONS, TIME };

    static constexpr int kClockStride = 64;

    explicit BudgetManager(const SearchConfig& config)
        : max_seconds_(config.budget_seconds), max_expansions_(config.max_expansions) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
        hit_ = Limit::NONE;
    }

    void recordExpansion() { expansions_++; }

    /// False once either limit has been reached; limitHit() says which.
    bool canContinue() {
        if (hit_ != Limit::NONE) return false;
        if (max_expansions_ > 0 && expansions_ >= max_expansions_) {
            hit_ = Limit::EXPANSIONS;
        } else if (max_seconds_ > 0.0 && expansions_ % kClockStride == 0 &&
                   elapsedSeconds() >= max_seconds_) {
            hit_ = Limit::TIME;
        }
        return hit_ == Limit::NONE;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int expansions() const { return expansions_; }
    Limit limitHit() const { return hit_; }

private:
    double max_seconds_;
    int max_expansions_;
    int expansions_ = 0;
    Limit hit_ = Limit::NONE;
    std::chrono::steady_clock::time_point start_time_;
};

inline const char* limitName(BudgetManager::Limit limit) {
    switch (limit) {
        case BudgetManager::Limit::EXPANSIONS: return "expansion limit";
        case BudgetManager::Limit::TIME: return "time limit";
        case BudgetManager::Limit::NONE: break;
    }
    return "none";
}

} // namespace puzlib
