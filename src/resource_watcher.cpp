#include "resource_watcher.hpp"

namespace notifctl {

resource_watcher::resource_watcher(resource_identity identity,
                                   std::shared_ptr<spdlog::logger> log)
    : m_identity(std::move(identity)), m_log(std::move(log))
{}

void resource_watcher::deliver(raw_payload payload) {
    event_type type;
    {
        std::lock_guard<std::mutex> lock(m_cache_mutex);
        type = m_cache ? event_type::updated : event_type::added;
        m_cache = payload;
    }

    if (type == event_type::added) {
        m_log->info("{} found", m_identity.describe());
    } else {
        m_log->debug("{} updated ({} keys)", m_identity.describe(), payload.size());
    }

    m_events.enqueue(resource_event{m_identity.kind, type, std::move(payload)});
}

void resource_watcher::remove() {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    if (m_cache) {
        m_cache.reset();
        m_log->warn("{} was deleted", m_identity.describe());
    }
}

void resource_watcher::mark_synced() {
    if (!m_synced.exchange(true)) {
        m_log->debug("{} cache synced", m_identity.describe());
    }
}

bool resource_watcher::has_synced() const {
    return m_synced.load();
}

std::vector<raw_payload> resource_watcher::list() const {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    if (m_cache) return {*m_cache};
    return {};
}

bool resource_watcher::next(resource_event& ev, std::chrono::milliseconds timeout) {
    if (m_closed.load(std::memory_order_relaxed)) return false;
    return m_events.wait_dequeue_timed(ev, timeout);
}

void resource_watcher::close() {
    m_closed.store(true);
}

bool resource_watcher::closed() const {
    return m_closed.load();
}

std::size_t resource_watcher::pending() const {
    return m_events.size_approx();
}

} // namespace notifctl
