#include "kv_resource_source.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

using notifctl::event_type;
using notifctl::kv_operation;
using notifctl::resource_kind;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

constexpr std::chrono::milliseconds short_wait{50};

class kv_change_test : public ::testing::Test {
protected:
    kv_change_test()
        : log(make_log()),
          watcher({resource_kind::settings, "argocd-notifications-cm"}, log)
    {}

    void apply(std::string_view key, kv_operation op, std::string_view value = {}) {
        notifctl::apply_kv_change(watcher, key, op, value, *log);
    }

    std::shared_ptr<spdlog::logger> log;
    notifctl::resource_watcher watcher;
};

} // namespace

TEST_F(kv_change_test, put_delivers_decoded_payload) {
    apply("argocd-notifications-cm", kv_operation::put, "context: |\n  region: eu\n");

    notifctl::resource_event ev;
    ASSERT_TRUE(watcher.next(ev, short_wait));
    EXPECT_EQ(ev.type, event_type::added);
    EXPECT_EQ(ev.payload.at("context"), "region: eu\n");
    ASSERT_EQ(watcher.list().size(), 1u);
}

TEST_F(kv_change_test, other_keys_are_ignored) {
    apply("argocd-notifications-secret", kv_operation::put, "token: x\n");
    apply("argocd-cm", kv_operation::remove);

    notifctl::resource_event ev;
    EXPECT_FALSE(watcher.next(ev, short_wait));
    EXPECT_TRUE(watcher.list().empty());
}

TEST_F(kv_change_test, remove_clears_cache_without_event) {
    apply("argocd-notifications-cm", kv_operation::put, "a: '1'\n");
    notifctl::resource_event ev;
    ASSERT_TRUE(watcher.next(ev, short_wait));

    apply("argocd-notifications-cm", kv_operation::remove);
    EXPECT_TRUE(watcher.list().empty());
    EXPECT_FALSE(watcher.next(ev, short_wait));
}

TEST_F(kv_change_test, remove_of_absent_resource_is_harmless) {
    apply("argocd-notifications-cm", kv_operation::remove);
    EXPECT_TRUE(watcher.list().empty());
    EXPECT_EQ(watcher.pending(), 0u);
}

TEST_F(kv_change_test, malformed_value_keeps_last_good_payload) {
    apply("argocd-notifications-cm", kv_operation::put, "a: '1'\n");
    notifctl::resource_event ev;
    ASSERT_TRUE(watcher.next(ev, short_wait));

    apply("argocd-notifications-cm", kv_operation::put, "a: [unclosed");
    apply("argocd-notifications-cm", kv_operation::put, "- not\n- a mapping\n");

    EXPECT_FALSE(watcher.next(ev, short_wait));
    auto items = watcher.list();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].at("a"), "1");

    // Next good value is an update of the cached one
    apply("argocd-notifications-cm", kv_operation::put, "a: '2'\n");
    ASSERT_TRUE(watcher.next(ev, short_wait));
    EXPECT_EQ(ev.type, event_type::updated);
    EXPECT_EQ(ev.payload.at("a"), "2");
}
