#pragma once

#include "resource.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace notifctl {

// Local view of one watched resource.
//
// The producer side (a KV watch callback) calls deliver()/remove()/mark_synced()
// from a single thread. deliver() never blocks: the event is queued and a
// consumer drains the stream through next(), in delivery order.
class resource_watcher {
public:
    resource_watcher(resource_identity identity,
                     std::shared_ptr<spdlog::logger> log);

    resource_watcher(const resource_watcher&) = delete;
    resource_watcher& operator=(const resource_watcher&) = delete;

    // Record the latest observed object and queue an added/updated event.
    void deliver(raw_payload payload);

    // The object was deleted from the store. Clears the cache, no event.
    void remove();

    // Initial listing complete. Monotonic.
    void mark_synced();
    bool has_synced() const;

    // Cached objects (zero or one).
    std::vector<raw_payload> list() const;

    // Wait up to `timeout` for the next event. Returns false on timeout
    // or once the watcher is closed.
    bool next(resource_event& ev, std::chrono::milliseconds timeout);

    // Stop handing out events; consumers return from next() promptly.
    void close();
    bool closed() const;

    std::size_t pending() const;

    const resource_identity& identity() const { return m_identity; }
    resource_kind kind() const { return m_identity.kind; }

private:
    resource_identity m_identity;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_cache_mutex;
    std::optional<raw_payload> m_cache;

    std::atomic<bool> m_synced{false};
    std::atomic<bool> m_closed{false};

    moodycamel::BlockingConcurrentQueue<resource_event> m_events;
};

} // namespace notifctl
