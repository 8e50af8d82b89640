#pragma once

#include "label_selector.hpp"
#include "notifier.hpp"
#include "resource.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace notifctl {

struct template_def {
    std::string name;
    std::string title;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct trigger_condition {
    std::string when;
    std::vector<std::string> send;
    std::string once_per;
    std::string description;
};

struct trigger_def {
    std::string name;
    std::vector<trigger_condition> conditions;
};

// Connection parameters of one configured service, secrets resolved.
struct service_config {
    std::string name;
    std::string type;
    std::map<std::string, std::string> options;
};

struct subscription_def {
    std::vector<destination> recipients;
    std::vector<std::string> triggers;
    label_selector selector;
};

// Validated configuration derived from one settings + secrets pair.
// Immutable once handed to the lifecycle manager.
struct config_snapshot {
    // Assigned by the merger, strictly increasing per merge attempt
    uint64_t generation = 0;

    std::map<std::string, template_def> templates;
    std::map<std::string, trigger_def> triggers;
    std::map<std::string, service_config> services;
    std::vector<subscription_def> subscriptions;
    std::vector<std::string> default_triggers;
    std::map<std::string, std::string> context;

    notifier registry;
};

class validation_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Service types accepted in "service.<type>" keys.
bool is_known_service_type(const std::string& type);

// Parse settings and secrets into a snapshot, check every cross reference
// and register a sink for each configured service. Throws validation_error.
config_snapshot parse_snapshot(const raw_payload& settings, const raw_payload& secrets);

// parse_snapshot() plus the built-in console service.
class snapshot_validator {
public:
    explicit snapshot_validator(notification_service_sptr console);

    config_snapshot validate(const raw_payload& settings, const raw_payload& secrets) const;

private:
    notification_service_sptr m_console;
};

} // namespace notifctl
