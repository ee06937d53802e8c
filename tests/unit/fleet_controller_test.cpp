/**
 * @file fleet_controller_test.cpp
 * @brief FleetController reconcile, bookkeeping and update notification tests
 *
 * The io_context runs on a background thread so connection strands make
 * progress on their own. Fake transports stand in for devices; an in-memory
 * DeviceStore is the registry.
 */

#include "fleet/fleet_controller.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "mocks/fake_device_transport.hpp"
#include "mocks/mock_device_info_client.hpp"

using namespace lightfleet;
using namespace lightfleet::fleet;
using namespace lightfleet::tests;
using model::ConnectionStatus;
using testing::Return;
using testing::StrictMock;

namespace {

model::DeviceRecord make_record(const std::string &mac, const std::string &address,
                                model::Branch branch = model::Branch::STABLE, const std::string &name = "WLED") {
    model::DeviceRecord record;
    record.mac_address = mac;
    record.address = address;
    record.original_name = name;
    record.branch = branch;
    return record;
}

std::string snapshot_json(const std::string &name, const std::string &version) {
    return R"({"state":{"on":true,"bri":200},"info":{"name":")" + name + R"(","ver":")" + version +
           R"(","mac":"aabbccddeeff"}})";
}

release::ReleaseEntry release_entry(const std::string &tag, int64_t published_at_ms, bool prerelease = false) {
    release::ReleaseEntry entry;
    entry.tag_name = tag;
    entry.published_at_ms = published_at_ms;
    entry.is_prerelease = prerelease;
    return entry;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

class FleetControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        io_thread = std::thread([this] { io.run(); });
        client = std::make_shared<StrictMock<MockDeviceInfoClient>>();
        resolver = std::make_unique<first_contact::FirstContactResolver>(store, client);
    }

    void TearDown() override {
        if (controller) {
            controller->stop();
            controller.reset();
        }
        guard.reset();
        io_thread.join();
    }

    void start(FleetOptions options = FleetOptions{}) {
        options.backoff.base = std::chrono::seconds(10);
        options.bookkeeping_flush_interval_ms = 0;
        options.first_contact_workers = 2;
        controller = std::make_unique<FleetController>(io, store, *resolver, catalog, hub.factory(), options);
        controller->start();
        controller->drain();
    }

    void save(const model::DeviceRecord &record) {
        std::string error;
        ASSERT_TRUE(store.save(record, error)) << error;
    }

    // Waits for the transport for address to exist and fires open on it
    std::shared_ptr<FakeTransportState> open_device(const std::string &address) {
        const std::string url = "ws://" + address + "/ws";
        std::shared_ptr<FakeTransportState> transport;
        EXPECT_TRUE(wait_until([&] { return (transport = hub.last_for(url)) != nullptr; })) << url;
        if (transport) {
            transport->fire_open();
        }
        return transport;
    }

    ConnectionStatus status_of(const std::string &mac) {
        auto view = controller->device(mac);
        return view ? view->live.status : ConnectionStatus::DISCONNECTED;
    }

    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard =
        boost::asio::make_work_guard(io);
    std::thread io_thread;

    FakeTransportHub hub;
    registry::DeviceStore store;
    release::ReleaseCatalog catalog;
    std::shared_ptr<StrictMock<MockDeviceInfoClient>> client;
    std::unique_ptr<first_contact::FirstContactResolver> resolver;
    std::unique_ptr<FleetController> controller;
};

// ----------------------------------------------------------------------------
// Reconcile
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, StartConnectsEveryStoredDevice) {
    save(make_record("aa0000000001", "10.0.0.1"));
    save(make_record("aa0000000002", "10.0.0.2"));
    start();

    EXPECT_EQ(controller->active_count(), 2u);
    EXPECT_TRUE(wait_until([&] { return hub.count() == 2u; }));
    EXPECT_NE(hub.last_for("ws://10.0.0.1/ws"), nullptr);
    EXPECT_NE(hub.last_for("ws://10.0.0.2/ws"), nullptr);
    EXPECT_EQ(controller->connections_created(), 2u);
}

TEST_F(FleetControllerTest, NewRecordGetsConnection) {
    start();
    EXPECT_EQ(controller->active_count(), 0u);

    save(make_record("aa0000000001", "10.0.0.1"));
    EXPECT_TRUE(wait_until([&] { return controller->active_count() == 1u; }));
    open_device("10.0.0.1");
    EXPECT_TRUE(wait_until([&] { return status_of("aa0000000001") == ConnectionStatus::CONNECTED; }));
}

TEST_F(FleetControllerTest, RemovedRecordReleasesConnection) {
    save(make_record("aa0000000001", "10.0.0.1"));
    save(make_record("aa0000000002", "10.0.0.2"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    std::string error;
    ASSERT_TRUE(store.remove("aa0000000001", error)) << error;

    EXPECT_TRUE(wait_until([&] { return controller->active_count() == 1u; }));
    EXPECT_EQ(controller->active_macs(), (std::set<std::string>{"aa0000000002"}));
    EXPECT_TRUE(wait_until([&] { return transport->is_closed(); }));
    EXPECT_EQ(controller->connections_destroyed(), 1u);
}

TEST_F(FleetControllerTest, AddressChangeReplacesConnection) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();
    auto old_transport = open_device("10.0.0.1");
    ASSERT_NE(old_transport, nullptr);

    save(make_record("aa0000000001", "10.0.0.99"));

    EXPECT_TRUE(wait_until([&] { return hub.last_for("ws://10.0.0.99/ws") != nullptr; }));
    EXPECT_TRUE(wait_until([&] { return old_transport->is_closed(); }));
    EXPECT_EQ(controller->active_count(), 1u);
    EXPECT_EQ(controller->device("aa0000000001")->connected_address, "10.0.0.99");
    EXPECT_EQ(controller->connections_created(), 2u);
    EXPECT_EQ(controller->connections_destroyed(), 1u);
}

TEST_F(FleetControllerTest, MetadataChangeKeepsConnection) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();

    auto record = make_record("aa0000000001", "10.0.0.1");
    record.custom_name = "Porch";
    record.is_hidden = true;
    save(record);
    controller->drain();

    EXPECT_TRUE(wait_until([&] { return controller->device("aa0000000001")->record.custom_name == "Porch"; }));
    EXPECT_EQ(controller->connections_created(), 1u);
    EXPECT_EQ(controller->connections_destroyed(), 0u);
}

TEST_F(FleetControllerTest, ExplicitReconcileIsIdempotent) {
    start();
    std::vector<model::DeviceRecord> records = {make_record("aa0000000001", "10.0.0.1"),
                                                make_record("aa0000000002", "10.0.0.2")};
    controller->reconcile(records);
    controller->reconcile(records);
    controller->drain();

    EXPECT_EQ(controller->active_count(), 2u);
    EXPECT_EQ(controller->connections_created(), 2u);
    EXPECT_EQ(controller->connections_destroyed(), 0u);

    controller->reconcile({});
    controller->drain();
    EXPECT_EQ(controller->active_count(), 0u);
    EXPECT_EQ(controller->connections_destroyed(), 2u);
}

TEST_F(FleetControllerTest, DuplicateMacKeepsFirstRecord) {
    start();
    controller->reconcile({make_record("aa0000000001", "10.0.0.1"), make_record("aa0000000001", "10.0.0.2"),
                           make_record("", "10.0.0.3")});
    controller->drain();

    ASSERT_EQ(controller->active_count(), 1u);
    EXPECT_EQ(controller->device("aa0000000001")->connected_address, "10.0.0.1");
}

// ----------------------------------------------------------------------------
// Pause / resume / refresh
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, PauseDisconnectsAndResumeReconnects) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    controller->pause();
    controller->drain();
    EXPECT_TRUE(controller->is_paused());
    EXPECT_TRUE(wait_until([&] { return transport->is_closed(); }));

    // Devices added while paused stay idle
    save(make_record("aa0000000002", "10.0.0.2"));
    EXPECT_TRUE(wait_until([&] { return controller->active_count() == 2u; }));
    controller->drain();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(hub.last_for("ws://10.0.0.2/ws"), nullptr);

    std::string error;
    model::StatePatch patch;
    patch.on = true;
    EXPECT_FALSE(controller->send_state("aa0000000001", patch, error));
    EXPECT_NE(error.find("paused"), std::string::npos);

    controller->resume();
    EXPECT_FALSE(controller->is_paused());
    EXPECT_TRUE(wait_until([&] { return hub.last_for("ws://10.0.0.2/ws") != nullptr; }));
    EXPECT_TRUE(wait_until([&] { return hub.last_for("ws://10.0.0.1/ws") != transport; }));
}

TEST_F(FleetControllerTest, RefreshReconnectsOfflineDevices) {
    save(make_record("aa0000000001", "10.0.0.1"));
    save(make_record("aa0000000002", "10.0.0.2"));
    start();
    auto healthy = open_device("10.0.0.1");
    auto failing = open_device("10.0.0.2");
    ASSERT_NE(failing, nullptr);
    failing->fire_failure(connection::TransportError::READ_FAILURE);

    EXPECT_TRUE(wait_until([&] {
        auto view = controller->device("aa0000000002");
        return view && view->live.status == ConnectionStatus::DISCONNECTED && view->reconnect_in.has_value();
    }));
    const size_t before = hub.count();

    controller->refresh_offline();
    EXPECT_TRUE(wait_until([&] { return hub.count() == before + 1; }));
    EXPECT_NE(hub.last_for("ws://10.0.0.2/ws"), failing);
    EXPECT_EQ(hub.last_for("ws://10.0.0.1/ws"), healthy);
}

// ----------------------------------------------------------------------------
// send_state
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, SendStateReachesDevice) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    model::StatePatch patch;
    patch.brightness = 77;
    std::string error;
    ASSERT_TRUE(controller->send_state("aa0000000001", patch, error)) << error;
    EXPECT_TRUE(wait_until([&] { return transport->sent_messages().size() == 1u; }));
    EXPECT_EQ(transport->sent_messages()[0], R"({"bri":77})");
}

TEST_F(FleetControllerTest, SendStateRejectsUnknownOrEmpty) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();

    std::string error;
    model::StatePatch patch;
    EXPECT_FALSE(controller->send_state("aa0000000001", patch, error));

    patch.on = true;
    EXPECT_FALSE(controller->send_state("ffffffffffff", patch, error));
    EXPECT_NE(error.find("not found"), std::string::npos);
}

// ----------------------------------------------------------------------------
// Snapshot bookkeeping
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, FirstSnapshotClassifiesBranchAndAdoptsName) {
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::UNKNOWN, "Old Name"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    transport->fire_message(snapshot_json("WLED-Porch", "0.15.0-b2"));

    EXPECT_TRUE(wait_until([&] {
        auto record = store.find_by_mac("aabbccddeeff");
        return record && record->branch == model::Branch::BETA;
    }));
    auto record = store.find_by_mac("aabbccddeeff");
    EXPECT_EQ(record->original_name, "WLED-Porch");
    EXPECT_GT(record->last_seen_ms, 0);
    EXPECT_EQ(controller->connections_created(), 1u);
}

TEST_F(FleetControllerTest, StableVersionClassifiedStable) {
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::UNKNOWN, "WLED"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    transport->fire_message(snapshot_json("WLED", "0.14.4"));
    EXPECT_TRUE(wait_until([&] {
        auto record = store.find_by_mac("aabbccddeeff");
        return record && record->branch == model::Branch::STABLE;
    }));
}

TEST_F(FleetControllerTest, MissingVersionClassifiedStable) {
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::UNKNOWN, "WLED"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    transport->fire_message(snapshot_json("WLED", ""));
    EXPECT_TRUE(wait_until([&] {
        auto record = store.find_by_mac("aabbccddeeff");
        return record && record->branch == model::Branch::STABLE;
    }));
}

TEST_F(FleetControllerTest, LastSeenBatchedUntilFlush) {
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::STABLE, "WLED"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    transport->fire_message(snapshot_json("WLED", "0.14.4"));
    EXPECT_TRUE(wait_until([&] { return controller->pending_bookkeeping() == 1u; }));
    EXPECT_EQ(store.find_by_mac("aabbccddeeff")->last_seen_ms, 0);

    controller->flush_bookkeeping();
    controller->drain();
    EXPECT_EQ(controller->pending_bookkeeping(), 0u);
    EXPECT_GT(store.find_by_mac("aabbccddeeff")->last_seen_ms, 0);
}

TEST_F(FleetControllerTest, StopFlushesLastSeen) {
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::STABLE, "WLED"));
    start();
    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);

    transport->fire_message(snapshot_json("WLED", "0.14.4"));
    EXPECT_TRUE(wait_until([&] { return controller->pending_bookkeeping() == 1u; }));

    controller->stop();
    EXPECT_FALSE(controller->is_running());
    EXPECT_EQ(controller->active_count(), 0u);
    EXPECT_TRUE(wait_until([&] { return transport->is_closed(); }));
    EXPECT_GT(store.find_by_mac("aabbccddeeff")->last_seen_ms, 0);
}

// ----------------------------------------------------------------------------
// Update availability
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, UpdateListenerSeesChangesOnly) {
    catalog.replace({release_entry("0.14.0", 100)});
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::STABLE, "WLED"));

    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> seen;
    start();
    controller->on_update_changed([&](const std::string &mac, const std::optional<std::string> &tag) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(mac, tag.value_or("none"));
    });
    auto count = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size();
    };

    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);
    transport->fire_message(snapshot_json("WLED", "0.13.0"));
    ASSERT_TRUE(wait_until([&] { return count() == 1u; }));
    EXPECT_EQ(controller->device("aabbccddeeff")->available_update.value_or(""), "0.14.0");

    // Repeated snapshots with the same version report nothing new
    transport->fire_message(snapshot_json("WLED", "0.13.0"));
    EXPECT_TRUE(wait_until([&] { return controller->pending_bookkeeping() == 1u; }));
    controller->drain();
    EXPECT_EQ(count(), 1u);

    // New release in the catalog
    catalog.replace({release_entry("0.14.0", 100), release_entry("0.15.0", 200)});
    controller->recompute_updates();
    ASSERT_TRUE(wait_until([&] { return count() == 2u; }));

    // Skipping it clears the offer
    auto record = *store.find_by_mac("aabbccddeeff");
    record.skip_update_tag = "0.15.0";
    save(record);
    ASSERT_TRUE(wait_until([&] { return count() == 3u; }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen[0].second, "0.14.0");
    EXPECT_EQ(seen[1].second, "0.15.0");
    EXPECT_EQ(seen[2].second, "none");
}

TEST_F(FleetControllerTest, RemovingDeviceWithOfferNotifiesNone) {
    catalog.replace({release_entry("0.14.0", 100)});
    save(make_record("aabbccddeeff", "10.0.0.1", model::Branch::STABLE, "WLED"));
    start();

    std::mutex mutex;
    std::vector<std::string> seen;
    controller->on_update_changed([&](const std::string &, const std::optional<std::string> &tag) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(tag.value_or("none"));
    });
    auto count = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size();
    };

    auto transport = open_device("10.0.0.1");
    ASSERT_NE(transport, nullptr);
    transport->fire_message(snapshot_json("WLED", "0.13.0"));
    ASSERT_TRUE(wait_until([&] { return count() == 1u; }));

    std::string error;
    ASSERT_TRUE(store.remove("aabbccddeeff", error));
    ASSERT_TRUE(wait_until([&] { return count() == 2u; }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen[1], "none");
}

// ----------------------------------------------------------------------------
// Discovery intake
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, DiscoveredKnownMacTakesFastPath) {
    save(make_record("aabbccddeeff", "10.0.0.1"));
    start();

    // StrictMock: no probe allowed
    controller->handle_discovered("10.0.0.50", std::string("aabbccddeeff"));

    EXPECT_TRUE(wait_until([&] { return store.find_by_mac("aabbccddeeff")->address == "10.0.0.50"; }));
    EXPECT_TRUE(wait_until([&] { return hub.last_for("ws://10.0.0.50/ws") != nullptr; }));
}

TEST_F(FleetControllerTest, DiscoveredUnknownDeviceIsProbedAndAdded) {
    EXPECT_CALL(*client, fetch_info("10.0.0.60"))
        .WillOnce(Return(MockDeviceInfoClient::ok("112233445566", "WLED-Garage")));
    start();

    controller->handle_discovered("10.0.0.60", std::nullopt);

    EXPECT_TRUE(wait_until([&] { return store.find_by_mac("112233445566").has_value(); }));
    EXPECT_EQ(store.find_by_mac("112233445566")->original_name, "WLED-Garage");
    EXPECT_TRUE(wait_until([&] { return controller->active_count() == 1u; }));
}

TEST_F(FleetControllerTest, FailedProbeAddsNothing) {
    std::atomic<bool> probed{false};
    EXPECT_CALL(*client, fetch_info("10.0.0.61"))
        .WillOnce(testing::DoAll(testing::Assign(&probed, true),
                                 Return(MockDeviceInfoClient::unreachable("refused"))));
    start();

    controller->handle_discovered("10.0.0.61", std::string("unknownmac00"));
    ASSERT_TRUE(wait_until([&] { return probed.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    controller->drain();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(controller->active_count(), 0u);
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

TEST_F(FleetControllerTest, StopIsIdempotentAndIgnoresLaterChanges) {
    save(make_record("aa0000000001", "10.0.0.1"));
    start();
    controller->stop();
    controller->stop();

    save(make_record("aa0000000002", "10.0.0.2"));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(controller->active_count(), 0u);
    EXPECT_EQ(controller->connections_created(), 1u);
}
