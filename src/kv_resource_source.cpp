#include "kv_resource_source.hpp"
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace notifctl {

kv_resource_source::kv_resource_source(nats_asio::iconnection_sptr conn,
                                       resource_watcher& watcher,
                                       std::string bucket,
                                       std::chrono::milliseconds sync_grace,
                                       std::chrono::seconds retry_interval,
                                       std::shared_ptr<spdlog::logger> log)
    : m_conn(std::move(conn)), m_watcher(watcher), m_bucket(std::move(bucket)),
      m_sync_grace(sync_grace), m_retry_interval(retry_interval), m_log(std::move(log))
{}

void apply_kv_change(resource_watcher& watcher,
                     std::string_view key,
                     kv_operation op,
                     std::string_view value,
                     spdlog::logger& log)
{
    if (key != watcher.identity().name) {
        log.debug("kv_resource_source: ignoring KV entry for key '{}'", key);
        return;
    }

    if (op == kv_operation::remove) {
        watcher.remove();
        return;
    }

    raw_payload payload;
    try {
        payload = decode_payload(value);
    } catch (const std::exception& e) {
        log.error("kv_resource_source: ignoring malformed {}: {}",
                  watcher.identity().describe(), e.what());
        return;
    }
    watcher.deliver(std::move(payload));
}

void kv_resource_source::on_kv_entry(const nats_asio::kv_entry& entry) {
    // del and purge both mean the resource no longer exists
    auto op = entry.op == nats_asio::kv_entry::operation::put
        ? kv_operation::put : kv_operation::remove;
    std::string value(entry.value.begin(), entry.value.end());
    apply_kv_change(m_watcher, entry.key, op, value, *m_log);
}

asio::awaitable<void> kv_resource_source::run() {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    const auto& key = m_watcher.identity().name;

    while (true) {
        auto [watcher, status] = co_await m_conn->kv_watch(
            m_bucket,
            [this](const nats_asio::kv_entry& entry) -> asio::awaitable<void> {
                on_kv_entry(entry);
                co_return;
            },
            key
        );

        if (!status.failed()) {
            m_kv_watcher = watcher;
            break;
        }

        m_log->error("kv_resource_source: failed to watch '{}' in bucket '{}': {} (retrying in {}s)",
                    key, m_bucket, status.error(), m_retry_interval.count());
        timer.expires_after(m_retry_interval);
        co_await timer.async_wait(asio::use_awaitable);
    }

    m_log->info("kv_resource_source: watching {} in bucket '{}'",
               m_watcher.identity().describe(), m_bucket);

    // Existing values are delivered right after the watch is established
    timer.expires_after(m_sync_grace);
    co_await timer.async_wait(asio::use_awaitable);
    m_watcher.mark_synced();
}

} // namespace notifctl
