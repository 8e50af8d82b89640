#include "metrics_server.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

void fill_registry(notifctl::metrics_registry& reg) {
    reg.describe("notifications_controller_restarts_total", "Worker restarts",
                 notifctl::metrics_registry::metric_type::counter);
    reg.increment("notifications_controller_restarts_total");
}

} // namespace

TEST(metrics_server, handler_renders_registry) {
    notifctl::metrics_registry reg;
    fill_registry(reg);

    httplib::Request req;
    req.method = "GET";
    req.path = "/metrics";
    httplib::Response res;
    notifctl::handle_metrics_request(reg, req, res);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Content-Type"), notifctl::metrics_content_type);
    EXPECT_EQ(res.body, reg.render());
}

TEST(metrics_server, serves_metrics_over_http) {
    auto reg = std::make_shared<notifctl::metrics_registry>();
    fill_registry(*reg);

    notifctl::metrics_server server("127.0.0.1", 0, reg, make_log());
    auto port = server.start();
    ASSERT_GT(port, 0);
    EXPECT_TRUE(server.running());

    httplib::Client client("127.0.0.1", port);
    auto res = client.Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("notifications_controller_restarts_total 1\n"), std::string::npos);

    // Values are read at scrape time
    reg->increment("notifications_controller_restarts_total");
    res = client.Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_NE(res->body.find("notifications_controller_restarts_total 2\n"), std::string::npos);

    res = client.Get("/");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    server.stop();
    EXPECT_FALSE(server.running());
}

TEST(metrics_server, stop_is_idempotent) {
    auto reg = std::make_shared<notifctl::metrics_registry>();
    notifctl::metrics_server server("127.0.0.1", 0, reg, make_log());
    server.stop();
    server.start();
    server.stop();
    server.stop();
    EXPECT_FALSE(server.running());
}
