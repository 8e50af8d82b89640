#pragma once

#include "label_selector.hpp"
#include "metrics.hpp"
#include "settings.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>

namespace notifctl {

// Everything a worker needs besides its configuration snapshot.
struct worker_options {
    std::string namespace_name;
    label_selector selector;
    metrics_registry_sptr metrics;
    unsigned int concurrency = 1;
};

// One instance of the notification worker, bound to a single snapshot.
class iworker {
public:
    virtual ~iworker() = default;

    // Prepare the worker. Throws on failure. Runs to completion before run().
    virtual void init(std::stop_token scope) = 0;

    // Process until `scope` is stop-requested, then return.
    virtual void run(std::stop_token scope, unsigned int concurrency) = 0;
};

using iworker_uptr = std::unique_ptr<iworker>;

class worker_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Builds a worker for a snapshot. Throws on construction failure.
using worker_factory = std::function<iworker_uptr(
    std::shared_ptr<const config_snapshot> snapshot, const worker_options& options)>;

} // namespace notifctl
