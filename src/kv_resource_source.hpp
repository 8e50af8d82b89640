#pragma once

#include "resource_watcher.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace notifctl {

enum class kv_operation { put, remove };

// Apply one change of the KV bucket to `watcher`.
// Changes for other keys are ignored. A put is decoded and delivered; a
// malformed value is logged and dropped, keeping the last good value. A
// remove clears the cache without emitting an event.
void apply_kv_change(resource_watcher& watcher,
                     std::string_view key,
                     kv_operation op,
                     std::string_view value,
                     spdlog::logger& log);

// Feeds one resource_watcher from a NATS KV bucket.
//
// The resource is the key named by the watcher's identity inside `bucket`.
// Puts are decoded and delivered; deletes and purges clear the cache. The
// watcher is marked synced once the initial values had `sync_grace` to
// arrive after the watch was established.
class kv_resource_source {
public:
    kv_resource_source(nats_asio::iconnection_sptr conn,
                       resource_watcher& watcher,
                       std::string bucket,
                       std::chrono::milliseconds sync_grace,
                       std::chrono::seconds retry_interval,
                       std::shared_ptr<spdlog::logger> log);

    // Establish the KV watch, retrying until it succeeds, then mark the
    // watcher synced. Must be spawned on the connection's io_context.
    asio::awaitable<void> run();

private:
    // KV watcher callback - invoked on entry changes
    void on_kv_entry(const nats_asio::kv_entry& entry);

    nats_asio::iconnection_sptr m_conn;
    resource_watcher& m_watcher;
    std::string m_bucket;
    std::chrono::milliseconds m_sync_grace;
    std::chrono::seconds m_retry_interval;
    std::shared_ptr<spdlog::logger> m_log;
    nats_asio::ikv_watcher_sptr m_kv_watcher;
};

} // namespace notifctl
