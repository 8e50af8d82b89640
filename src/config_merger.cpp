#include "config_merger.hpp"
#include <chrono>
#include <functional>

namespace notifctl {

config_merger::config_merger(snapshot_validator validator,
                             lifecycle_manager& lifecycle,
                             fatal_handler on_fatal,
                             std::shared_ptr<spdlog::logger> log)
    : m_validator(std::move(validator)), m_lifecycle(lifecycle),
      m_on_fatal(std::move(on_fatal)), m_log(std::move(log))
{}

config_merger::~config_merger() {
    stop();
}

void config_merger::on_update(resource_kind kind, raw_payload payload) {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (kind) {
        case resource_kind::settings: m_settings = std::move(payload); break;
        case resource_kind::secrets:  m_secrets = std::move(payload); break;
    }

    if (!m_settings || !m_secrets) {
        m_log->debug("Received {} update, waiting for {}", to_string(kind),
                     m_settings ? "secrets" : "settings");
        return;
    }

    m_attempts.fetch_add(1, std::memory_order_relaxed);

    std::shared_ptr<config_snapshot> snap;
    try {
        snap = std::make_shared<config_snapshot>(m_validator.validate(*m_settings, *m_secrets));
    } catch (const std::exception& e) {
        m_on_fatal(std::string("Failed to parse new settings: ") + e.what());
        return;
    }
    snap->generation = ++m_generation;

    m_log->debug("Merged configuration generation {} ({} templates, {} triggers, {} services)",
                 snap->generation, snap->templates.size(), snap->triggers.size(),
                 snap->services.size());

    try {
        m_lifecycle.apply(std::move(snap));
    } catch (const worker_error& e) {
        m_on_fatal(std::string("Failed to start controller: ") + e.what());
    }
}

void config_merger::start(std::vector<resource_watcher*> watchers) {
    if (m_running.exchange(true)) return; // already started

    m_watchers = std::move(watchers);
    m_threads.reserve(m_watchers.size());
    for (auto* w : m_watchers) {
        m_threads.emplace_back(&config_merger::consume, this, std::ref(*w));
    }
    m_log->debug("Config merger started with {} watchers", m_watchers.size());
}

void config_merger::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    for (auto* w : m_watchers) {
        w->close();
    }
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->debug("Config merger stopped");
}

void config_merger::consume(resource_watcher& watcher) {
    resource_event ev;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        if (!watcher.next(ev, std::chrono::milliseconds(100))) {
            if (watcher.closed()) break;
            continue;
        }
        m_log->debug("{}: {} event", watcher.identity().describe(), to_string(ev.type));
        on_update(ev.kind, std::move(ev.payload));
    }
}

} // namespace notifctl
