#include "resource.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace notifctl {

std::string resource_identity::describe() const {
    switch (kind) {
        case resource_kind::settings: return "config map " + name;
        case resource_kind::secrets:  return "secret " + name;
    }
    return name;
}

const char* to_string(resource_kind kind) {
    switch (kind) {
        case resource_kind::settings: return "settings";
        case resource_kind::secrets:  return "secrets";
    }
    return "unknown";
}

const char* to_string(event_type type) {
    switch (type) {
        case event_type::added:   return "added";
        case event_type::updated: return "updated";
    }
    return "unknown";
}

raw_payload decode_payload(std::string_view bytes) {
    raw_payload payload;

    // An empty value is an existing resource without data
    if (bytes.empty()) return payload;

    YAML::Node root;
    try {
        root = YAML::Load(std::string(bytes));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("resource value is not valid YAML: ") + e.what());
    }

    if (root.IsNull()) return payload;
    if (!root.IsMap()) {
        throw std::runtime_error("resource value must be a mapping");
    }

    for (const auto& item : root) {
        const auto& value = item.second;
        if (!value.IsScalar() && !value.IsNull()) {
            throw std::runtime_error("resource value '" + item.first.as<std::string>() +
                                     "' must be a string");
        }
        payload[item.first.as<std::string>()] = value.IsNull() ? std::string{} : value.as<std::string>();
    }
    return payload;
}

} // namespace notifctl
