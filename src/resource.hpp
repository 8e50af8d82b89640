#pragma once

#include <map>
#include <string>
#include <string_view>

namespace notifctl {

// The two externally stored resources that drive the worker.
enum class resource_kind {
    settings,
    secrets
};

enum class event_type {
    added,
    updated
};

// Data of a resource as last observed: key -> value.
using raw_payload = std::map<std::string, std::string>;

// One change delivered by a watcher. The kind tag is set at the watcher
// boundary so consumers never inspect the payload to tell resources apart.
struct resource_event {
    resource_kind kind;
    event_type type;
    raw_payload payload;
};

// Human-readable identity used in operator-facing messages,
// e.g. "config map argocd-notifications-cm".
struct resource_identity {
    resource_kind kind;
    std::string name;

    std::string describe() const;
};

const char* to_string(resource_kind kind);
const char* to_string(event_type type);

// Decode a stored resource value (a YAML mapping of string to string).
// Throws std::runtime_error if the value is not such a mapping.
raw_payload decode_payload(std::string_view bytes);

} // namespace notifctl
