#include "dispatch_worker.hpp"
#include "fake_worker.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

using notifctl::notification_request;
using notifctl::raw_payload;
using test_support::make_log;
using test_support::wait_until;

namespace {

raw_payload sample_settings() {
    return {
        {"template.app-deployed",
            "title: Deployed {{app}}\n"
            "message: '{{app}} is now running revision {{ revision }} ({{argocdUrl}})'\n"},
        {"template.app-audit", "message: 'audit {{app}}'\n"},
        {"trigger.on-deployed",
            "- when: app.status.health.status == 'Healthy'\n"
            "  send: [app-deployed]\n"
            "- when: 'true'\n"
            "  send: [app-deployed, app-audit]\n"},
        {"trigger.on-created", "- when: 'true'\n  send: [app-audit]\n"},
        {"service.webhook.hooks", "url: http://hooks.local\n"},
        {"subscriptions",
            "- recipients: ['console:ops']\n"
            "  triggers: [on-deployed]\n"
            "  selector: team=platform\n"
            "- recipients: ['console:ops', 'console:audit']\n"
            "  triggers: [on-deployed]\n"
            "- recipients: ['console:defaults']\n"},
        {"defaultTriggers", "- on-created\n"},
        {"context", "argocdUrl: https://argocd.example.com\n"},
    };
}

class failing_service : public notifctl::notification_service {
public:
    void send(const notifctl::notification&, const notifctl::destination&) override {
        throw std::runtime_error("connection refused");
    }
};

// Local HTTP endpoint recording webhook bodies.
class webhook_receiver {
public:
    explicit webhook_receiver(int status = 200) {
        m_server.Post("/argocd", [this, status](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_bodies.push_back(req.body);
            res.status = status;
        });
        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        wait_until([this] { return m_server.is_running(); });
    }

    ~webhook_receiver() {
        m_server.stop();
        m_thread.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

    std::vector<std::string> bodies() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bodies;
    }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::mutex m_mutex;
    std::vector<std::string> m_bodies;
};

class dispatch_worker_test : public ::testing::Test {
protected:
    dispatch_worker_test()
        : metrics(std::make_shared<notifctl::metrics_registry>())
    {
        options.namespace_name = "argocd";
        options.metrics = metrics;
    }

    std::shared_ptr<const notifctl::config_snapshot> make_snapshot(const raw_payload& settings) {
        notifctl::snapshot_validator validator(std::make_shared<notifctl::console_service>(out));
        return std::make_shared<const notifctl::config_snapshot>(validator.validate(settings, {}));
    }

    std::ostringstream out;
    notifctl::metrics_registry_sptr metrics;
    notifctl::worker_options options;
    notifctl::request_queue queue;
};

} // namespace

TEST(notification_request, parses_json) {
    auto req = notifctl::parse_notification_request(
        R"({"trigger":"on-deployed","labels":{"team":"platform"},"vars":{"app":"guestbook"}})");
    EXPECT_EQ(req.trigger, "on-deployed");
    EXPECT_EQ(req.labels.at("team"), "platform");
    EXPECT_EQ(req.vars.at("app"), "guestbook");
}

TEST(notification_request, labels_and_vars_are_optional) {
    auto req = notifctl::parse_notification_request(R"({"trigger":"on-created"})");
    EXPECT_EQ(req.trigger, "on-created");
    EXPECT_TRUE(req.labels.empty());
    EXPECT_TRUE(req.vars.empty());
}

TEST(notification_request, rejects_malformed_input) {
    EXPECT_ANY_THROW(notifctl::parse_notification_request("not json"));
    EXPECT_ANY_THROW(notifctl::parse_notification_request(R"({"labels":{}})"));
    EXPECT_ANY_THROW(notifctl::parse_notification_request(R"({"trigger":""})"));
    EXPECT_ANY_THROW(notifctl::parse_notification_request(R"({"trigger":"x","vars":{"n":1}})"));
}

TEST(render_text, substitutes_known_placeholders) {
    std::map<std::string, std::string> vars = {{"app", "guestbook"}, {"rev", "abc"}};
    EXPECT_EQ(notifctl::render_text("{{app}} at {{ rev }}", vars), "guestbook at abc");
    EXPECT_EQ(notifctl::render_text("{{missing}} stays", vars), "{{missing}} stays");
    EXPECT_EQ(notifctl::render_text("unterminated {{app", vars), "unterminated {{app");
    EXPECT_EQ(notifctl::render_text("", vars), "");
}

TEST_F(dispatch_worker_test, recipients_follow_subscriptions) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    auto platform = worker.recipients("on-deployed", {{"team", "platform"}});
    ASSERT_EQ(platform.size(), 2u);
    EXPECT_EQ(platform[0].recipient, "ops");
    EXPECT_EQ(platform[1].recipient, "audit");

    auto other = worker.recipients("on-deployed", {{"team", "data"}});
    ASSERT_EQ(other.size(), 2u);

    // Subscriptions without triggers receive the default triggers only
    auto created = worker.recipients("on-created", {});
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].recipient, "defaults");
}

TEST_F(dispatch_worker_test, dispatch_renders_templates) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    notification_request req;
    req.trigger = "on-deployed";
    req.vars = {{"app", "guestbook"}, {"revision", "4f2a"}};

    // Two recipients, each receiving both templates of the trigger
    EXPECT_EQ(worker.dispatch(req), 4u);

    auto text = out.str();
    EXPECT_NE(text.find("To: ops"), std::string::npos);
    EXPECT_NE(text.find("To: audit"), std::string::npos);
    EXPECT_NE(text.find("Title: Deployed guestbook"), std::string::npos);
    EXPECT_NE(text.find("Body: guestbook is now running revision 4f2a (https://argocd.example.com)"),
              std::string::npos);
    EXPECT_NE(text.find("Body: audit guestbook"), std::string::npos);

    auto s = worker.get_stats();
    EXPECT_EQ(s.processed, 1u);
    EXPECT_EQ(s.delivered, 4u);
    EXPECT_EQ(s.failures, 0u);
    EXPECT_EQ(metrics->counter_value("notifications_deliveries_total",
                                     {{"service", "console"}, {"trigger", "on-deployed"}}), 4u);
}

TEST_F(dispatch_worker_test, request_vars_override_context) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    notification_request req;
    req.trigger = "on-deployed";
    req.labels = {{"team", "platform"}};
    req.vars = {{"app", "a"}, {"revision", "1"}, {"argocdUrl", "http://override"}};
    worker.dispatch(req);

    EXPECT_NE(out.str().find("(http://override)"), std::string::npos);
}

TEST_F(dispatch_worker_test, selector_mismatch_is_skipped) {
    options.selector = notifctl::label_selector::parse("team=platform");
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    notification_request req;
    req.trigger = "on-deployed";
    req.labels = {{"team", "data"}};
    EXPECT_EQ(worker.dispatch(req), 0u);
    EXPECT_TRUE(out.str().empty());

    auto s = worker.get_stats();
    EXPECT_EQ(s.processed, 1u);
    EXPECT_EQ(s.skipped, 1u);
}

TEST_F(dispatch_worker_test, unknown_trigger_counts_as_failure) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    notification_request req;
    req.trigger = "on-nothing";
    EXPECT_EQ(worker.dispatch(req), 0u);
    EXPECT_EQ(worker.get_stats().failures, 1u);
}

TEST_F(dispatch_worker_test, webhook_recipient_receives_post) {
    webhook_receiver receiver;
    auto settings = sample_settings();
    settings["service.webhook.hooks"] = "url: " + receiver.url("/argocd") + "\n";
    settings["subscriptions"] = "- recipients: ['hooks:ops']\n  triggers: [on-created]\n";
    notifctl::dispatch_worker worker(make_snapshot(settings), options, queue, make_log());

    notification_request req;
    req.trigger = "on-created";
    req.vars = {{"app", "guestbook"}};
    EXPECT_EQ(worker.dispatch(req), 1u);

    auto bodies = receiver.bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto doc = nlohmann::json::parse(bodies[0]);
    EXPECT_EQ(doc.at("recipient"), "ops");
    EXPECT_EQ(doc.at("message"), "audit guestbook");
    EXPECT_EQ(metrics->counter_value("notifications_deliveries_total",
                                     {{"service", "hooks"}, {"trigger", "on-created"}}), 1u);
}

TEST_F(dispatch_worker_test, webhook_error_status_fails_delivery) {
    webhook_receiver receiver(500);
    auto settings = sample_settings();
    settings["service.webhook.hooks"] = "url: " + receiver.url("/argocd") + "\n";
    settings["subscriptions"] = "- recipients: [hooks]\n  triggers: [on-created]\n";
    notifctl::dispatch_worker worker(make_snapshot(settings), options, queue, make_log());

    notification_request req;
    req.trigger = "on-created";
    EXPECT_EQ(worker.dispatch(req), 0u);
    EXPECT_EQ(worker.get_stats().failures, 1u);
    EXPECT_EQ(metrics->counter_value("notifications_delivery_failures_total",
                                     {{"service", "hooks"}}), 1u);
}

TEST_F(dispatch_worker_test, send_failure_does_not_stop_other_recipients) {
    notifctl::snapshot_validator validator(std::make_shared<notifctl::console_service>(out));
    auto settings = sample_settings();
    settings["subscriptions"] =
        "- recipients: [hooks, 'console:ops']\n  triggers: [on-created]\n";
    auto snap = validator.validate(settings, {});
    snap.registry.add_service("hooks", std::make_shared<failing_service>());

    notifctl::dispatch_worker worker(
        std::make_shared<const notifctl::config_snapshot>(std::move(snap)), options, queue, make_log());

    notification_request req;
    req.trigger = "on-created";
    req.vars = {{"app", "guestbook"}};
    EXPECT_EQ(worker.dispatch(req), 1u);

    auto s = worker.get_stats();
    EXPECT_EQ(s.delivered, 1u);
    EXPECT_EQ(s.failures, 1u);
    EXPECT_NE(out.str().find("Body: audit guestbook"), std::string::npos);
}

TEST_F(dispatch_worker_test, init_honors_cancellation) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    std::stop_source scope;
    scope.request_stop();
    EXPECT_THROW(worker.init(scope.get_token()), notifctl::worker_error);
}

TEST_F(dispatch_worker_test, run_processes_queue_until_cancelled) {
    notifctl::dispatch_worker worker(make_snapshot(sample_settings()), options, queue, make_log());

    std::stop_source scope;
    worker.init(scope.get_token());
    std::thread runner([&] { worker.run(scope.get_token(), 2); });

    for (int i = 0; i < 10; ++i) {
        notification_request req;
        req.trigger = "on-created";
        req.vars = {{"app", "app-" + std::to_string(i)}};
        queue.enqueue(std::move(req));
    }

    EXPECT_TRUE(wait_until([&] { return worker.get_stats().processed == 10; }));
    scope.request_stop();
    runner.join();

    auto s = worker.get_stats();
    EXPECT_EQ(s.delivered, 10u);
    EXPECT_EQ(s.failures, 0u);
}
