#pragma once

#include "resource_watcher.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace notifctl {

class sync_timeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Block until every watcher has completed its initial listing.
// Throws sync_timeout if that does not happen within `timeout`.
//
// Resources still absent after sync are reported in one warning and
// returned. That is the normal "waiting for initial configuration" state:
// the merger picks them up as soon as they are created.
std::vector<resource_identity> await_initial_sync(
    const std::vector<const resource_watcher*>& watchers,
    std::chrono::milliseconds timeout,
    spdlog::logger& log);

} // namespace notifctl
