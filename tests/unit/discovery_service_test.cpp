/**
 * @file discovery_service_test.cpp
 * @brief DiscoveryService driven by a fake service browser
 *
 * The fake stands in for avahi: tests announce and remove instances through
 * it. A TCP acceptor on the loopback stands in for the controller's HTTP
 * port so the connect probe succeeds.
 */

#include "discovery/discovery_service.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mocks/fake_service_browser.hpp"

using namespace lightfleet;
using namespace lightfleet::discovery;
using lightfleet::tests::FakeBrowserHub;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        hub = std::make_shared<FakeBrowserHub>();
        acceptor = std::make_unique<tcp::acceptor>(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        device_port = acceptor->local_endpoint().port();
    }

    void TearDown() override {
        if (service) {
            service->cancel();
            io.restart();
            io.poll();
        }
    }

    std::shared_ptr<DiscoveryService> make_service(int retry_interval_ms = 10000) {
        DiscoveryOptions options;
        options.retry_interval_ms = retry_interval_ms;
        options.probe_timeout_ms = 1000;
        service = DiscoveryService::create(
            io, options,
            [this](const std::string &address, const std::optional<std::string> &mac) {
                found.emplace_back(address, mac);
            },
            tests::make_fake_browser_factory(hub));
        return service;
    }

    // Runs the io_context until pred holds or timeout passes
    template <typename Pred>
    bool run_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred() && std::chrono::steady_clock::now() < deadline) {
            io.restart();
            io.run_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    void run_for(std::chrono::milliseconds duration) {
        run_until([] { return false; }, duration);
    }

    void start_scan() {
        service->scan();
        io.restart();
        io.poll();
        ASSERT_TRUE(hub->is_running());
    }

    asio::io_context io;
    std::shared_ptr<FakeBrowserHub> hub;
    std::shared_ptr<DiscoveryService> service;
    std::unique_ptr<tcp::acceptor> acceptor;
    uint16_t device_port = 0;
    std::vector<std::pair<std::string, std::optional<std::string>>> found;
};

TEST_F(DiscoveryServiceTest, CreateHandsOutSoleOwnership) {
    make_service();
    EXPECT_EQ(service.use_count(), 1);
    EXPECT_EQ(service->shared_from_this(), service);
    EXPECT_FALSE(service->is_scanning());
    EXPECT_EQ(hub->created, 0);
}

TEST_F(DiscoveryServiceTest, ReportsResolvedDevice) {
    make_service();
    EXPECT_EQ(service->service_name(), "_wled._tcp.local");
    start_scan();
    EXPECT_EQ(hub->service_type, "_wled._tcp");
    EXPECT_EQ(hub->domain, "local");

    hub->announce("Porch", "127.0.0.1", device_port, {{"mac", "aabbccddeeff"}});
    ASSERT_TRUE(run_until([this] { return !found.empty(); }));

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].first, "127.0.0.1:" + std::to_string(device_port));
    ASSERT_TRUE(found[0].second.has_value());
    EXPECT_EQ(*found[0].second, "aabbccddeeff");
    EXPECT_TRUE(service->is_scanning());
    EXPECT_EQ(service->scans_started(), 1u);
    EXPECT_EQ(service->devices_reported(), 1u);
}

TEST_F(DiscoveryServiceTest, MissingMacHintIsEmpty) {
    make_service();
    start_scan();

    hub->announce("Porch", "127.0.0.1", device_port, {{"other", "1"}, {"mac", ""}});
    ASSERT_TRUE(run_until([this] { return !found.empty(); }));

    ASSERT_EQ(found.size(), 1u);
    EXPECT_FALSE(found[0].second.has_value());
}

TEST_F(DiscoveryServiceTest, RepeatedAnnouncementIsReportedOnce) {
    make_service();
    start_scan();

    hub->announce("Porch", "127.0.0.1", device_port);
    ASSERT_TRUE(run_until([this] { return !found.empty(); }));
    hub->announce("porch", "127.0.0.1", device_port);
    run_for(std::chrono::milliseconds(100));

    EXPECT_EQ(found.size(), 1u);
    EXPECT_EQ(service->devices_reported(), 1u);
}

TEST_F(DiscoveryServiceTest, RemovedInstanceIsReportedAgain) {
    make_service();
    start_scan();

    hub->announce("Porch", "127.0.0.1", device_port);
    ASSERT_TRUE(run_until([this] { return found.size() == 1; }));

    hub->remove("Porch");
    hub->announce("Porch", "127.0.0.1", device_port);
    ASSERT_TRUE(run_until([this] { return found.size() == 2; }));
    EXPECT_EQ(service->devices_reported(), 2u);
}

TEST_F(DiscoveryServiceTest, FailedProbeIsRetried) {
    const uint16_t port = device_port;
    acceptor.reset();  // nothing listens for now

    make_service(100);
    start_scan();
    hub->announce("Porch", "127.0.0.1", port, {{"mac", "aabbccddeeff"}});

    EXPECT_FALSE(run_until([this] { return !found.empty(); }, std::chrono::milliseconds(300)));
    EXPECT_TRUE(service->is_scanning());
    EXPECT_EQ(service->devices_reported(), 0u);

    acceptor = std::make_unique<tcp::acceptor>(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    ASSERT_TRUE(run_until([this] { return !found.empty(); }));
    EXPECT_EQ(found[0].first, "127.0.0.1:" + std::to_string(port));
    ASSERT_TRUE(found[0].second.has_value());
    EXPECT_EQ(*found[0].second, "aabbccddeeff");
}

TEST_F(DiscoveryServiceTest, UnusableAddressIsIgnored) {
    make_service();
    start_scan();

    hub->announce("Porch", "not-an-ip", device_port);
    run_for(std::chrono::milliseconds(100));

    EXPECT_TRUE(found.empty());
    EXPECT_TRUE(service->is_scanning());
}

TEST_F(DiscoveryServiceTest, BrowserFailureCancelsScan) {
    make_service();
    start_scan();

    hub->fail("avahi client: Daemon connection failed");
    ASSERT_TRUE(run_until([this] { return !service->is_scanning(); }));

    EXPECT_EQ(service->scans_failed(), 1u);
    EXPECT_EQ(hub->stop_count(), 1);
    EXPECT_FALSE(hub->is_running());
}

TEST_F(DiscoveryServiceTest, BrowserStartFailureFailsScan) {
    hub->start_error = "cannot connect to avahi-daemon";
    make_service();

    service->scan();
    io.poll();

    EXPECT_FALSE(service->is_scanning());
    EXPECT_EQ(service->scans_started(), 1u);
    EXPECT_EQ(service->scans_failed(), 1u);
}

TEST_F(DiscoveryServiceTest, MissingBrowserFailsScan) {
    DiscoveryOptions options;
    service = DiscoveryService::create(io, options, nullptr, nullptr);

    service->scan();
    io.poll();

    EXPECT_FALSE(service->is_scanning());
    EXPECT_EQ(service->scans_failed(), 1u);
}

TEST_F(DiscoveryServiceTest, EventsAfterCancelAreIgnored) {
    make_service();
    start_scan();

    hub->announce("Porch", "127.0.0.1", device_port);
    service->cancel();
    run_for(std::chrono::milliseconds(200));

    EXPECT_TRUE(found.empty());
    EXPECT_FALSE(service->is_scanning());
}

TEST_F(DiscoveryServiceTest, ScanWhileScanningIsIgnored) {
    make_service();

    service->scan();
    service->scan();
    io.poll();

    EXPECT_EQ(service->scans_started(), 1u);
    EXPECT_EQ(hub->created, 1);
    EXPECT_TRUE(service->is_scanning());

    service->cancel();
    io.poll();
    EXPECT_FALSE(service->is_scanning());
    EXPECT_EQ(hub->stop_count(), 1);

    // A later scan starts fresh with a new browser
    service->scan();
    io.restart();
    io.poll();
    EXPECT_EQ(service->scans_started(), 2u);
    EXPECT_EQ(hub->created, 2);
    EXPECT_TRUE(hub->is_running());
}
