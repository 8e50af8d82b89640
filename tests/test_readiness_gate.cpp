#include "readiness_gate.hpp"
#include "config_merger.hpp"
#include "fake_worker.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <thread>

using notifctl::resource_kind;
using test_support::make_factory;
using test_support::make_log;
using test_support::wait_until;
using test_support::worker_journal;

namespace {

struct captured_log {
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> log;

    captured_log()
        : log(std::make_shared<spdlog::logger>(
              "gate", std::make_shared<spdlog::sinks::ostream_sink_mt>(out))) {
        log->set_pattern("%l %v");
    }
};

} // namespace

TEST(readiness_gate, times_out_when_watcher_never_syncs) {
    notifctl::resource_watcher cm({resource_kind::settings, "argocd-notifications-cm"}, make_log());
    notifctl::resource_watcher secret({resource_kind::secrets, "argocd-notifications-secret"}, make_log());
    cm.mark_synced();

    auto log = make_log();
    EXPECT_THROW(notifctl::await_initial_sync({&cm, &secret}, std::chrono::milliseconds(150), *log),
                 notifctl::sync_timeout);
}

TEST(readiness_gate, waits_for_late_sync) {
    notifctl::resource_watcher cm({resource_kind::settings, "argocd-notifications-cm"}, make_log());
    notifctl::resource_watcher secret({resource_kind::secrets, "argocd-notifications-secret"}, make_log());

    std::thread syncer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cm.deliver({{"context", "a: b\n"}});
        cm.mark_synced();
        secret.deliver({});
        secret.mark_synced();
    });

    captured_log cap;
    auto missing = notifctl::await_initial_sync({&cm, &secret}, std::chrono::seconds(5), *cap.log);
    syncer.join();

    EXPECT_TRUE(missing.empty());
    EXPECT_EQ(cap.out.str().find("Cannot find"), std::string::npos);
}

TEST(readiness_gate, warns_once_naming_both_missing_resources) {
    notifctl::resource_watcher cm({resource_kind::settings, "argocd-notifications-cm"}, make_log());
    notifctl::resource_watcher secret({resource_kind::secrets, "argocd-notifications-secret"}, make_log());
    cm.mark_synced();
    secret.mark_synced();

    captured_log cap;
    auto missing = notifctl::await_initial_sync({&cm, &secret}, std::chrono::seconds(1), *cap.log);

    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0].kind, resource_kind::settings);
    EXPECT_EQ(missing[1].kind, resource_kind::secrets);

    auto text = cap.out.str();
    EXPECT_NE(text.find("warning Cannot find config map argocd-notifications-cm and "
                        "secret argocd-notifications-secret. "
                        "Waiting when both config map and secret are created."),
              std::string::npos);
    EXPECT_EQ(text.find("Cannot find"), text.rfind("Cannot find"));
}

TEST(readiness_gate, names_only_the_missing_resource) {
    notifctl::resource_watcher cm({resource_kind::settings, "argocd-notifications-cm"}, make_log());
    notifctl::resource_watcher secret({resource_kind::secrets, "argocd-notifications-secret"}, make_log());
    cm.deliver({});
    cm.mark_synced();
    secret.mark_synced();

    captured_log cap;
    auto missing = notifctl::await_initial_sync({&cm, &secret}, std::chrono::seconds(1), *cap.log);

    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].name, "argocd-notifications-secret");
    EXPECT_NE(cap.out.str().find("Cannot find secret argocd-notifications-secret."),
              std::string::npos);
}

TEST(readiness_gate, worker_starts_once_missing_resources_appear) {
    std::ostringstream console_out;
    auto journal = std::make_shared<worker_journal>();
    bool fatal_called = false;

    notifctl::resource_watcher cm({resource_kind::settings, "argocd-notifications-cm"}, make_log());
    notifctl::resource_watcher secret({resource_kind::secrets, "argocd-notifications-secret"}, make_log());

    notifctl::lifecycle_manager lifecycle(make_factory(journal), notifctl::worker_options{}, make_log());
    notifctl::config_merger merger(
        notifctl::snapshot_validator(std::make_shared<notifctl::console_service>(console_out)),
        lifecycle, [&](const std::string&) { fatal_called = true; }, make_log());
    merger.start({&cm, &secret});

    cm.mark_synced();
    secret.mark_synced();

    auto missing = notifctl::await_initial_sync({&cm, &secret}, std::chrono::seconds(1), *make_log());
    EXPECT_EQ(missing.size(), 2u);
    EXPECT_FALSE(lifecycle.running());

    secret.deliver({{"hooks-url", "http://hooks.local/argocd"}});
    cm.deliver({{"service.webhook.hooks", "url: $hooks-url\n"}});

    EXPECT_TRUE(wait_until([&] { return lifecycle.running(); }));
    merger.stop();

    EXPECT_FALSE(fatal_called);
    ASSERT_EQ(journal->created(), 1u);
    EXPECT_EQ(journal->last_snapshot()->services.at("hooks").options.at("url"), "http://hooks.local/argocd");
}
