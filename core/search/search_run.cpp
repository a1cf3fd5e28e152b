#include "search/search_run.hpp"
#include "util/log.hpp"

namespace puzlib {

SearchRun::SearchRun(const char* algorithm, const SearchConfig& config, SearchStats* stats)
    : algorithm_(algorithm),
      budget_(config),
      stats_(stats) {
    budget_.start();
}

bool SearchRun::tryExpand() {
    if (!budget_.canContinue()) return false;
    budget_.recordExpansion();
    return true;
}

void SearchRun::finish(bool found, size_t visited) {
    double elapsed = budget_.elapsedSeconds();
    bool exhausted = budget_.limitHit() != BudgetManager::Limit::NONE;

    if (stats_) {
        stats_->expansions = budget_.expansions();
        stats_->visited = visited;
        stats_->max_frontier = max_frontier_;
        stats_->elapsed_seconds = elapsed;
        stats_->budget_exhausted = exhausted;
        stats_->found = found;
    }

    auto log = logging::get();
    if (exhausted) {
        log->info("{}: {} reached after {} expansions ({:.3f}s), {} states visited",
                  algorithm_, limitName(budget_.limitHit()), budget_.expansions(), elapsed,
                  visited);
        return;
    }
    log->debug("{}: {} after {} expansions, {} states visited, frontier peak {}",
               algorithm_, found ? "goal reached" : "frontier exhausted",
               budget_.expansions(), visited, max_frontier_);
}

} // namespace puzlib
