#include "readiness_gate.hpp"
#include <algorithm>
#include <string>
#include <thread>

namespace notifctl {

namespace {

constexpr std::chrono::milliseconds poll_interval{100};

bool all_synced(const std::vector<const resource_watcher*>& watchers) {
    return std::all_of(watchers.begin(), watchers.end(),
                       [](const resource_watcher* w) { return w->has_synced(); });
}

} // anonymous namespace

std::vector<resource_identity> await_initial_sync(
    const std::vector<const resource_watcher*>& watchers,
    std::chrono::milliseconds timeout,
    spdlog::logger& log)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!all_synced(watchers)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw sync_timeout("timed out waiting for caches to sync");
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            poll_interval, deadline - now));
    }

    std::vector<resource_identity> missing;
    std::string names;
    for (const auto* w : watchers) {
        if (!w->list().empty()) continue;
        if (!names.empty()) names += " and ";
        names += w->identity().describe();
        missing.push_back(w->identity());
    }

    if (!missing.empty()) {
        log.warn("Cannot find {}. Waiting when both config map and secret are created.", names);
    } else {
        log.info("Initial configuration loaded");
    }
    return missing;
}

} // namespace notifctl
