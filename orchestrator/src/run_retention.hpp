#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Drops finished runs from an id -> state map: first those finished longer
// than `retention` ago, then the oldest finished ones while more than
// `max_runs` remain. Running entries are never dropped. `finished_at`
// returns nullopt for a run still in progress. Returns the number dropped.
template <typename RunMap, typename FinishedAt>
size_t prune_finished_runs(RunMap& runs, std::chrono::seconds retention, size_t max_runs,
                           FinishedAt finished_at) {
    auto now = std::chrono::system_clock::now();
    std::vector<std::pair<std::chrono::system_clock::time_point, std::string>> finished;
    size_t dropped = 0;

    for (auto it = runs.begin(); it != runs.end();) {
        auto at = finished_at(*it->second);
        if (at && now - *at > retention) {
            it = runs.erase(it);
            ++dropped;
            continue;
        }
        if (at) finished.emplace_back(*at, it->first);
        ++it;
    }

    if (runs.size() > max_runs) {
        std::sort(finished.begin(), finished.end());
        for (const auto& entry : finished) {
            if (runs.size() <= max_runs) break;
            runs.erase(entry.second);
            ++dropped;
        }
    }
    return dropped;
}
