#pragma once

#include <spdlog/common.h>
#include <string>
#include <cstdint>
#include <optional>

namespace notifctl {

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Namespace the controller handles. Maps to the KV bucket that holds
    // the settings and secrets resources.
    std::string namespace_name = "default";

    // Well-known resource keys inside the namespace bucket
    std::string settings_name = "argocd-notifications-cm";
    std::string secrets_name = "argocd-notifications-secret";

    // Notification requests for the running worker arrive here
    std::string request_subject = "notifications.requests";

    // Only requests whose labels match this selector are processed
    std::string app_label_selector;

    // Worker
    unsigned int processors_count = 1;

    // Startup
    uint32_t sync_timeout_seconds = 60;
    uint32_t sync_grace_ms = 500;
    uint32_t watch_retry_seconds = 5;

    // Operational
    uint16_t metrics_port = 9001;
    int stats_interval_seconds = 60;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace notifctl
