#pragma once

#include "search/budget_manager.hpp"
#include "search/search_state.hpp"

#include <cstddef>

namespace puzlib {

/// Bookkeeping shared by every search entry point: budget checks,
/// frontier high-water mark, stats reporting and the completion log line.
class SearchRun {
public:
    SearchRun(const char* algorithm, const SearchConfig& config, SearchStats* stats);

    /// Record one expansion. Returns false once the budget is spent, in
    /// which case the caller must stop without expanding.
    bool tryExpand();

    void trackFrontier(size_t size) {
        if (size > max_frontier_) max_frontier_ = size;
    }

    /// Fill in the caller's stats (if any) and log the outcome.
    void finish(bool found, size_t visited);

    const char* algorithm() const { return algorithm_; }

private:
    const char* algorithm_;
    BudgetManager budget_;
    SearchStats* stats_;
    size_t max_frontier_ = 0;
};

} // namespace puzlib
