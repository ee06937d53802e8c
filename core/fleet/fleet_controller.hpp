#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "connection/device_connection.hpp"
#include "first_contact/first_contact_resolver.hpp"
#include "model/device_record.hpp"
#include "registry/device_store.hpp"
#include "release/release_catalog.hpp"
#include "update/update_checker.hpp"
#include "writer_inbox.hpp"

namespace lightfleet {
namespace fleet {

struct FleetOptions {
    connection::BackoffPolicy backoff;
    int first_contact_workers = 4;
    int bookkeeping_flush_interval_ms = 30000;  // 0 disables the periodic flush
};

// Copy of one managed device, safe to hold on any thread
struct FleetDeviceView {
    model::DeviceRecord record;
    std::string connected_address;  // address the live connection was opened against
    model::LiveDeviceState live;
    std::optional<std::string> available_update;
    int retry_count = 0;
    std::optional<std::chrono::milliseconds> reconnect_in;
};

using UpdateListener = std::function<void(const std::string &mac_address, const std::optional<std::string> &tag)>;

/**
 * @brief Keeps one live DeviceConnection per known Device Record
 *
 * Every structural change (reconcile, pause/resume, bookkeeping writes) runs
 * on a single writer thread fed by a WriterInbox, so reconcile never overlaps
 * itself. Store change notifications coalesce into one queued reconcile that
 * re-reads the whole store when it runs.
 *
 * Discovery results take the fast path (address patch for a known MAC) on
 * the writer; anything else is probed on a worker pool and only the final
 * upsert comes back to the writer.
 *
 * Decoded device snapshots drive bookkeeping: last-seen is batched and
 * flushed periodically, while branch classification and reported-name drift
 * are written immediately.
 */
class FleetController {
public:
    FleetController(boost::asio::io_context &io, registry::IDeviceStore &store,
                    first_contact::FirstContactResolver &resolver, release::ReleaseCatalog &catalog,
                    connection::TransportFactory transport_factory, FleetOptions options = FleetOptions{});
    ~FleetController();

    FleetController(const FleetController &) = delete;
    FleetController &operator=(const FleetController &) = delete;

    // Subscribes to the store, starts the writer and queues the first reconcile
    void start();
    // Tears down every connection and flushes bookkeeping. Idempotent.
    void stop();
    bool is_running() const { return running_.load(); }

    // Queues a reconcile against an explicit record set
    void reconcile(std::vector<model::DeviceRecord> records);

    // Entry point for discovery results
    void handle_discovered(const std::string &address, const std::optional<std::string> &mac_hint);

    void pause();
    void resume();
    bool is_paused() const { return paused_.load(); }

    // Connects every connection that is not CONNECTED (no-op while paused)
    void refresh_offline();

    bool send_state(const std::string &mac_address, const model::StatePatch &patch, std::string &error);

    // Re-evaluates every device against the current catalog
    void recompute_updates();

    // Queues a write of pending last-seen values
    void flush_bookkeeping();

    // Blocks until every task queued before the call has run. Must not be
    // called from the writer thread.
    void drain();

    int on_update_changed(UpdateListener listener);
    void remove_update_listener(int listener_id);

    std::vector<FleetDeviceView> devices() const;
    std::optional<FleetDeviceView> device(const std::string &mac_address) const;
    std::set<std::string> active_macs() const;
    size_t active_count() const;

    size_t pending_bookkeeping() const;
    uint64_t connections_created() const { return connections_created_.load(); }
    uint64_t connections_destroyed() const { return connections_destroyed_.load(); }
    uint64_t reconciles() const { return reconciles_.load(); }

private:
    struct ActiveDevice {
        std::shared_ptr<connection::DeviceConnection> connection;
        std::string address;
        model::DeviceRecord record;
        std::string version;  // last reported firmware version
        update::UpdateTracker tracker;
    };

    using Notification = std::pair<std::string, std::optional<std::string>>;

    void writer_loop();
    bool post(WriterInbox::Task task);
    void queue_store_reconcile();

    // Writer-only
    void apply_reconcile(const std::vector<model::DeviceRecord> &records);
    std::shared_ptr<connection::DeviceConnection> open_connection(const model::DeviceRecord &record);
    void close_connection(const std::string &mac_address, ActiveDevice &device);
    void handle_snapshot(const std::string &mac_address, const model::StateSnapshot &snapshot);
    bool evaluate_update(const std::string &mac_address, ActiveDevice &device,
                         const std::vector<release::ReleaseEntry> &catalog, int64_t revision,
                         std::vector<Notification> &notifications);
    void flush_bookkeeping_now();
    void teardown_all();
    void notify_update_listeners(const std::vector<Notification> &notifications);

    boost::asio::io_context &io_;
    registry::IDeviceStore &store_;
    first_contact::FirstContactResolver &resolver_;
    release::ReleaseCatalog &catalog_;
    connection::TransportFactory transport_factory_;
    FleetOptions options_;

    // Shared with connection listeners, which may outlive a queued task
    std::shared_ptr<WriterInbox> inbox_;
    std::thread writer_thread_;
    std::thread::id writer_id_;
    std::unique_ptr<boost::asio::thread_pool> first_contact_pool_;
    int store_listener_id_ = 0;

    mutable std::shared_mutex active_mutex_;
    std::map<std::string, ActiveDevice> active_;

    mutable std::mutex bookkeeping_mutex_;
    std::map<std::string, int64_t> pending_last_seen_;
    std::chrono::steady_clock::time_point last_flush_;

    std::mutex listeners_mutex_;
    std::map<int, UpdateListener> update_listeners_;
    int next_listener_id_ = 1;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> reconcile_queued_{false};
    std::atomic<uint64_t> connections_created_{0};
    std::atomic<uint64_t> connections_destroyed_{0};
    std::atomic<uint64_t> reconciles_{0};
};

}  // namespace fleet
}  // namespace lightfleet
