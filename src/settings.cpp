#include "settings.hpp"
#include "webhook_service.hpp"
#include <yaml-cpp/yaml.h>
#include <set>

namespace notifctl {

namespace {

const std::string template_prefix = "template.";
const std::string trigger_prefix  = "trigger.";
const std::string service_prefix  = "service.";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

YAML::Node load_value(const std::string& key, const std::string& value) {
    try {
        return YAML::Load(value);
    } catch (const YAML::Exception& e) {
        throw validation_error("failed to parse '" + key + "': " + e.what());
    }
}

// Scalars as-is, anything else re-emitted as YAML.
std::string node_to_string(const YAML::Node& node) {
    if (node.IsNull()) return {};
    if (node.IsScalar()) return node.as<std::string>();
    YAML::Emitter out;
    out << node;
    return out.c_str();
}

std::vector<std::string> string_list(const std::string& key, const YAML::Node& node,
                                     const char* field) {
    std::vector<std::string> list;
    if (!node || node.IsNull()) return list;
    if (node.IsScalar()) {
        list.push_back(node.as<std::string>());
        return list;
    }
    if (!node.IsSequence()) {
        throw validation_error("'" + key + "': '" + field + "' must be a list of strings");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw validation_error("'" + key + "': '" + field + "' must be a list of strings");
        }
        list.push_back(item.as<std::string>());
    }
    return list;
}

template_def parse_template(const std::string& key, const std::string& name,
                            const std::string& value) {
    auto root = load_value(key, value);
    if (!root.IsMap()) {
        throw validation_error("'" + key + "' must be a mapping");
    }

    template_def tmpl;
    tmpl.name = name;
    for (const auto& item : root) {
        auto field = item.first.as<std::string>();
        if (field == "message") {
            tmpl.message = node_to_string(item.second);
        } else if (field == "title") {
            tmpl.title = node_to_string(item.second);
        } else {
            tmpl.fields[field] = node_to_string(item.second);
        }
    }
    return tmpl;
}

trigger_def parse_trigger(const std::string& key, const std::string& name,
                          const std::string& value) {
    auto root = load_value(key, value);
    if (!root.IsSequence() || root.size() == 0) {
        throw validation_error("'" + key + "' must be a non-empty list of conditions");
    }

    trigger_def trig;
    trig.name = name;
    for (const auto& item : root) {
        if (!item.IsMap()) {
            throw validation_error("'" + key + "': condition must be a mapping");
        }
        trigger_condition cond;
        if (auto n = item["when"]; n && n.IsScalar()) {
            cond.when = n.as<std::string>();
        }
        if (cond.when.empty()) {
            throw validation_error("'" + key + "': condition is missing 'when'");
        }
        cond.send = string_list(key, item["send"], "send");
        if (cond.send.empty()) {
            throw validation_error("'" + key + "': condition is missing 'send'");
        }
        if (auto n = item["oncePer"])     cond.once_per = node_to_string(n);
        if (auto n = item["description"]) cond.description = node_to_string(n);
        trig.conditions.push_back(std::move(cond));
    }
    return trig;
}

service_config parse_service(const std::string& key, const std::string& value,
                             const raw_payload& secrets) {
    // service.<type> or service.<type>.<name>
    auto rest = key.substr(service_prefix.size());
    service_config svc;
    auto dot = rest.find('.');
    if (dot == std::string::npos) {
        svc.type = rest;
        svc.name = rest;
    } else {
        svc.type = rest.substr(0, dot);
        svc.name = rest.substr(dot + 1);
    }

    if (svc.type.empty() || svc.name.empty()) {
        throw validation_error("'" + key + "': invalid service key");
    }
    if (!is_known_service_type(svc.type)) {
        throw validation_error("'" + key + "': unknown service type '" + svc.type + "'");
    }
    if (!has_service_implementation(svc.type)) {
        throw validation_error("'" + key + "': service type '" + svc.type +
                               "' is not supported by this controller");
    }
    if (svc.name == console_service_name) {
        throw validation_error("'" + key + "': service name '" + svc.name + "' is reserved");
    }

    auto root = load_value(key, value);
    if (root.IsNull()) return svc;
    if (!root.IsMap()) {
        throw validation_error("'" + key + "' must be a mapping");
    }

    for (const auto& item : root) {
        auto option = item.first.as<std::string>();
        auto text = node_to_string(item.second);
        if (!text.empty() && text.front() == '$') {
            auto secret_key = text.substr(1);
            auto it = secrets.find(secret_key);
            if (it == secrets.end()) {
                throw validation_error("'" + key + "': option '" + option +
                                       "' references missing secret key '" + secret_key + "'");
            }
            text = it->second;
        }
        svc.options[option] = std::move(text);
    }
    return svc;
}

destination parse_recipient(const std::string& text) {
    auto colon = text.find(':');
    destination dest;
    if (colon == std::string::npos) {
        dest.service = text;
    } else {
        dest.service = text.substr(0, colon);
        dest.recipient = text.substr(colon + 1);
    }
    if (dest.service.empty()) {
        throw validation_error("'subscriptions': recipient '" + text + "' has no service");
    }
    return dest;
}

std::vector<subscription_def> parse_subscriptions(const std::string& value) {
    auto root = load_value("subscriptions", value);
    std::vector<subscription_def> subs;
    if (root.IsNull()) return subs;
    if (!root.IsSequence()) {
        throw validation_error("'subscriptions' must be a list");
    }

    for (const auto& item : root) {
        if (!item.IsMap()) {
            throw validation_error("'subscriptions': entry must be a mapping");
        }
        subscription_def sub;
        for (const auto& r : string_list("subscriptions", item["recipients"], "recipients")) {
            sub.recipients.push_back(parse_recipient(r));
        }
        if (sub.recipients.empty()) {
            throw validation_error("'subscriptions': entry has no recipients");
        }
        sub.triggers = string_list("subscriptions", item["triggers"], "triggers");
        if (auto n = item["selector"]) {
            try {
                sub.selector = label_selector::parse(node_to_string(n));
            } catch (const std::invalid_argument& e) {
                throw validation_error(std::string("'subscriptions': ") + e.what());
            }
        }
        subs.push_back(std::move(sub));
    }
    return subs;
}

std::map<std::string, std::string> parse_context(const std::string& value) {
    auto root = load_value("context", value);
    std::map<std::string, std::string> ctx;
    if (root.IsNull()) return ctx;
    if (!root.IsMap()) {
        throw validation_error("'context' must be a mapping");
    }
    for (const auto& item : root) {
        ctx[item.first.as<std::string>()] = node_to_string(item.second);
    }
    return ctx;
}

void check_references(const config_snapshot& snap) {
    for (const auto& [name, trig] : snap.triggers) {
        for (const auto& cond : trig.conditions) {
            for (const auto& tmpl : cond.send) {
                if (!snap.templates.count(tmpl)) {
                    throw validation_error("trigger '" + name +
                                           "' references undefined template '" + tmpl + "'");
                }
            }
        }
    }

    for (const auto& trig : snap.default_triggers) {
        if (!snap.triggers.count(trig)) {
            throw validation_error("'defaultTriggers' references undefined trigger '" + trig + "'");
        }
    }

    for (const auto& sub : snap.subscriptions) {
        for (const auto& trig : sub.triggers) {
            if (!snap.triggers.count(trig)) {
                throw validation_error("subscription references undefined trigger '" + trig + "'");
            }
        }
        for (const auto& dest : sub.recipients) {
            if (dest.service != console_service_name && !snap.services.count(dest.service)) {
                throw validation_error("subscription recipient '" + dest.service + ":" +
                                       dest.recipient + "' references undefined service '" +
                                       dest.service + "'");
            }
        }
    }
}

} // anonymous namespace

bool is_known_service_type(const std::string& type) {
    static const std::set<std::string> types = {
        "alertmanager", "email", "github", "googlechat", "grafana",
        "mattermost", "newrelic", "opsgenie", "pagerduty", "pagerdutyv2",
        "pushover", "rocketchat", "slack", "teams", "telegram", "webex", "webhook"
    };
    return types.count(type) > 0;
}

config_snapshot parse_snapshot(const raw_payload& settings, const raw_payload& secrets) {
    config_snapshot snap;

    for (const auto& [key, value] : settings) {
        if (starts_with(key, template_prefix)) {
            auto name = key.substr(template_prefix.size());
            if (name.empty()) throw validation_error("'" + key + "': empty template name");
            snap.templates[name] = parse_template(key, name, value);
        } else if (starts_with(key, trigger_prefix)) {
            auto name = key.substr(trigger_prefix.size());
            if (name.empty()) throw validation_error("'" + key + "': empty trigger name");
            snap.triggers[name] = parse_trigger(key, name, value);
        } else if (starts_with(key, service_prefix)) {
            auto svc = parse_service(key, value, secrets);
            if (snap.services.count(svc.name)) {
                throw validation_error("'" + key + "': duplicate service name '" + svc.name + "'");
            }
            auto name = svc.name;
            snap.services[name] = std::move(svc);
        } else if (key == "subscriptions") {
            snap.subscriptions = parse_subscriptions(value);
        } else if (key == "defaultTriggers") {
            snap.default_triggers = string_list(key, load_value(key, value), "defaultTriggers");
        } else if (key == "context") {
            snap.context = parse_context(value);
        }
    }

    check_references(snap);

    for (const auto& [name, svc] : snap.services) {
        snap.registry.add_service(name, make_service(svc));
    }
    return snap;
}

snapshot_validator::snapshot_validator(notification_service_sptr console)
    : m_console(std::move(console))
{}

config_snapshot snapshot_validator::validate(const raw_payload& settings,
                                             const raw_payload& secrets) const {
    auto snap = parse_snapshot(settings, secrets);
    // useful for debugging
    snap.registry.add_service(console_service_name, m_console);
    return snap;
}

} // namespace notifctl
