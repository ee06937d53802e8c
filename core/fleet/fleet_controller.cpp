#include "fleet_controller.hpp"

#include <boost/asio/post.hpp>
#include <future>

#include "logging/logger.hpp"

namespace lightfleet {
namespace fleet {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

FleetController::FleetController(boost::asio::io_context &io, registry::IDeviceStore &store,
                                 first_contact::FirstContactResolver &resolver, release::ReleaseCatalog &catalog,
                                 connection::TransportFactory transport_factory, FleetOptions options)
    : io_(io),
      store_(store),
      resolver_(resolver),
      catalog_(catalog),
      transport_factory_(std::move(transport_factory)),
      options_(options),
      inbox_(std::make_shared<WriterInbox>("fleet")) {}

FleetController::~FleetController() { stop(); }

void FleetController::start() {
    if (running_.load() || stopped_.load()) {
        return;
    }

    const int workers = options_.first_contact_workers > 0 ? options_.first_contact_workers : 1;
    first_contact_pool_ = std::make_unique<boost::asio::thread_pool>(static_cast<size_t>(workers));
    last_flush_ = std::chrono::steady_clock::now();

    running_ = true;
    writer_thread_ = std::thread(&FleetController::writer_loop, this);
    writer_id_ = writer_thread_.get_id();

    store_listener_id_ = store_.add_listener(
        [this](const std::vector<registry::StoreChange> & /*changes*/) { queue_store_reconcile(); });
    queue_store_reconcile();

    LOG_INFO("[Fleet] Started (" << workers << " first-contact workers, flush every "
                                 << options_.bookkeeping_flush_interval_ms << "ms)");
}

void FleetController::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    if (store_listener_id_ != 0) {
        store_.remove_listener(store_listener_id_);
        store_listener_id_ = 0;
    }

    // In-flight probes finish; queued ones are abandoned
    if (first_contact_pool_) {
        first_contact_pool_->stop();
        first_contact_pool_->join();
    }

    if (running_.load()) {
        inbox_->push([this] {
            teardown_all();
            flush_bookkeeping_now();
        });
        inbox_->close();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        running_ = false;
    } else {
        inbox_->close();
        teardown_all();
    }

    LOG_INFO("[Fleet] Stopped");
}

void FleetController::writer_loop() {
    while (true) {
        auto task = inbox_->pop(100);
        if (task) {
            (*task)();
        } else if (inbox_->is_closed()) {
            break;
        }

        if (options_.bookkeeping_flush_interval_ms > 0) {
            auto now = std::chrono::steady_clock::now();
            if (now - last_flush_ >= std::chrono::milliseconds(options_.bookkeeping_flush_interval_ms)) {
                flush_bookkeeping_now();
            }
        }
    }
}

bool FleetController::post(WriterInbox::Task task) {
    if (!inbox_->push(std::move(task))) {
        LOG_DEBUG("[Fleet] Writer closed, task dropped");
        return false;
    }
    return true;
}

void FleetController::queue_store_reconcile() {
    if (reconcile_queued_.exchange(true)) {
        return;
    }
    if (!post([this] {
            reconcile_queued_ = false;
            apply_reconcile(store_.fetch_all());
        })) {
        reconcile_queued_ = false;
    }
}

void FleetController::reconcile(std::vector<model::DeviceRecord> records) {
    post([this, records = std::move(records)] { apply_reconcile(records); });
}

void FleetController::apply_reconcile(const std::vector<model::DeviceRecord> &records) {
    ++reconciles_;

    std::map<std::string, model::DeviceRecord> wanted;
    for (const auto &record : records) {
        if (record.mac_address.empty()) {
            LOG_WARN("[Fleet] Skipping record without MAC (address '" << record.address << "')");
            continue;
        }
        if (!wanted.emplace(record.mac_address, record).second) {
            LOG_WARN("[Fleet] Duplicate record for " << record.mac_address << ", keeping the first");
        }
    }

    const auto catalog = catalog_.entries();
    const auto revision = catalog_.revision();
    std::vector<Notification> notifications;
    std::vector<std::shared_ptr<connection::DeviceConnection>> to_connect;
    int removed = 0;
    int replaced = 0;
    int added = 0;

    {
        std::unique_lock<std::shared_mutex> lock(active_mutex_);

        for (auto it = active_.begin(); it != active_.end();) {
            if (wanted.count(it->first) == 0) {
                close_connection(it->first, it->second);
                if (it->second.tracker.available()) {
                    notifications.emplace_back(it->first, std::nullopt);
                }
                it = active_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        for (const auto &entry : wanted) {
            const auto &mac = entry.first;
            const auto &record = entry.second;
            auto it = active_.find(mac);

            if (it == active_.end()) {
                ActiveDevice device;
                device.record = record;
                device.address = record.address;
                device.connection = open_connection(record);
                evaluate_update(mac, device, catalog, revision, notifications);
                to_connect.push_back(device.connection);
                active_.emplace(mac, std::move(device));
                ++added;
                continue;
            }

            auto &device = it->second;
            if (device.address != record.address) {
                LOG_INFO("[Fleet] " << mac << " moved from " << device.address << " to " << record.address);
                close_connection(mac, device);
                device.address = record.address;
                device.version.clear();
                device.connection = open_connection(record);
                to_connect.push_back(device.connection);
                ++replaced;
            }
            device.record = record;
            evaluate_update(mac, device, catalog, revision, notifications);
        }
    }

    if (!paused_.load()) {
        for (auto &conn : to_connect) {
            conn->connect();
        }
    }

    if (removed + replaced + added > 0) {
        LOG_INFO("[Fleet] Reconciled " << wanted.size() << " records: +" << added << " -" << removed << " ~"
                                       << replaced);
    }
    notify_update_listeners(notifications);
}

std::shared_ptr<connection::DeviceConnection> FleetController::open_connection(const model::DeviceRecord &record) {
    auto conn = connection::DeviceConnection::create(io_, record.mac_address, record.address, transport_factory_,
                                                     options_.backoff);

    std::weak_ptr<WriterInbox> inbox = inbox_;
    conn->set_snapshot_listener([this, inbox](const std::string &mac, const model::StateSnapshot &snapshot) {
        if (auto target = inbox.lock()) {
            target->push([this, mac, snapshot] { handle_snapshot(mac, snapshot); });
        }
    });

    ++connections_created_;
    return conn;
}

void FleetController::close_connection(const std::string &mac_address, ActiveDevice &device) {
    if (device.connection) {
        device.connection->destroy();
        device.connection.reset();
        ++connections_destroyed_;
        LOG_DEBUG("[Fleet] Released connection for " << mac_address);
    }
}

void FleetController::handle_snapshot(const std::string &mac_address, const model::StateSnapshot &snapshot) {
    const int64_t now = now_epoch_ms();
    const auto &info = snapshot.info;
    std::vector<Notification> notifications;

    {
        std::unique_lock<std::shared_mutex> lock(active_mutex_);
        auto it = active_.find(mac_address);
        if (it == active_.end()) {
            return;
        }
        auto &device = it->second;
        if (!info.version.empty() && info.version != device.version) {
            device.version = info.version;
            evaluate_update(mac_address, device, catalog_.entries(), catalog_.revision(), notifications);
        }
    }

    {
        std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
        pending_last_seen_[mac_address] = now;
    }

    auto stored = store_.find_by_mac(mac_address);
    if (stored) {
        auto record = *stored;
        bool material = false;

        // A device that does not report a version counts as stable
        if (record.branch == model::Branch::UNKNOWN) {
            record.branch = update::is_beta_version(info.version) ? model::Branch::BETA : model::Branch::STABLE;
            LOG_INFO("[Fleet] " << mac_address << " classified as " << model::branch_to_string(record.branch)
                                << " (version '" << info.version << "')");
            material = true;
        }
        if (!info.name.empty() && info.name != record.original_name) {
            LOG_INFO("[Fleet] " << mac_address << " renamed on device: '" << record.original_name << "' -> '"
                                << info.name << "'");
            record.original_name = info.name;
            material = true;
        }

        if (material) {
            record.last_seen_ms = now;
            std::string error;
            if (store_.save(record, error)) {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                auto pending = pending_last_seen_.find(mac_address);
                if (pending != pending_last_seen_.end() && pending->second <= now) {
                    pending_last_seen_.erase(pending);
                }
            } else {
                LOG_ERROR("[Fleet] Bookkeeping write for " << mac_address << " failed: " << error);
            }
        }
    }

    notify_update_listeners(notifications);
}

bool FleetController::evaluate_update(const std::string &mac_address, ActiveDevice &device,
                                      const std::vector<release::ReleaseEntry> &catalog, int64_t revision,
                                      std::vector<Notification> &notifications) {
    update::UpdateTracker::Inputs inputs;
    inputs.current_version = device.version;
    inputs.branch = device.record.branch;
    inputs.skip_tag = device.record.skip_update_tag;
    inputs.catalog_revision = revision;

    if (!device.tracker.evaluate(inputs, catalog)) {
        return false;
    }
    LOG_INFO("[Fleet] " << mac_address << " update: " << device.tracker.available().value_or("none"));
    notifications.emplace_back(mac_address, device.tracker.available());
    return true;
}

void FleetController::handle_discovered(const std::string &address, const std::optional<std::string> &mac_hint) {
    post([this, address, mac_hint] {
        if (resolver_.fast_update_address(mac_hint, address)) {
            return;
        }
        if (!first_contact_pool_ || stopped_.load()) {
            return;
        }

        boost::asio::post(*first_contact_pool_, [this, address] {
            auto result = resolver_.probe(address);
            if (!result.success) {
                LOG_WARN("[Fleet] First contact with " << address << " failed: "
                                                       << first_contact::first_contact_error_to_string(result.error)
                                                       << ": " << result.error_message);
                return;
            }
            auto identity = result.identity;
            post([this, identity] {
                auto upserted = resolver_.upsert(identity);
                if (!upserted.success) {
                    LOG_ERROR("[Fleet] Could not record " << identity.mac_address << ": "
                                                          << upserted.error_message);
                }
            });
        });
    });
}

void FleetController::pause() {
    if (paused_.exchange(true)) {
        return;
    }
    LOG_INFO("[Fleet] Pausing");
    post([this] {
        {
            std::shared_lock<std::shared_mutex> lock(active_mutex_);
            for (auto &entry : active_) {
                entry.second.connection->disconnect();
            }
        }
        flush_bookkeeping_now();
    });
}

void FleetController::resume() {
    if (!paused_.exchange(false)) {
        return;
    }
    LOG_INFO("[Fleet] Resuming");
    post([this] {
        std::shared_lock<std::shared_mutex> lock(active_mutex_);
        for (auto &entry : active_) {
            entry.second.connection->connect();
        }
    });
}

void FleetController::refresh_offline() {
    post([this] {
        if (paused_.load()) {
            return;
        }
        int count = 0;
        std::shared_lock<std::shared_mutex> lock(active_mutex_);
        for (auto &entry : active_) {
            if (entry.second.connection->status() == model::ConnectionStatus::DISCONNECTED) {
                entry.second.connection->connect();
                ++count;
            }
        }
        LOG_INFO("[Fleet] Refresh: reconnecting " << count << " offline devices");
    });
}

bool FleetController::send_state(const std::string &mac_address, const model::StatePatch &patch,
                                 std::string &error) {
    if (patch.empty()) {
        error = "Empty state change";
        return false;
    }
    if (paused_.load()) {
        error = "Fleet is paused";
        return false;
    }

    std::shared_ptr<connection::DeviceConnection> conn;
    {
        std::shared_lock<std::shared_mutex> lock(active_mutex_);
        auto it = active_.find(mac_address);
        if (it == active_.end()) {
            error = "Device not found: " + mac_address;
            return false;
        }
        conn = it->second.connection;
    }
    conn->send_state(patch);
    return true;
}

void FleetController::recompute_updates() {
    post([this] {
        const auto catalog = catalog_.entries();
        const auto revision = catalog_.revision();
        std::vector<Notification> notifications;
        {
            std::unique_lock<std::shared_mutex> lock(active_mutex_);
            for (auto &entry : active_) {
                evaluate_update(entry.first, entry.second, catalog, revision, notifications);
            }
        }
        LOG_DEBUG("[Fleet] Recomputed updates against catalog revision " << revision << " ("
                                                                          << notifications.size() << " changed)");
        notify_update_listeners(notifications);
    });
}

void FleetController::flush_bookkeeping() {
    post([this] { flush_bookkeeping_now(); });
}

void FleetController::flush_bookkeeping_now() {
    last_flush_ = std::chrono::steady_clock::now();

    std::map<std::string, int64_t> pending;
    {
        std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
        pending.swap(pending_last_seen_);
    }
    if (pending.empty()) {
        return;
    }

    std::vector<model::DeviceRecord> batch;
    for (const auto &entry : pending) {
        auto record = store_.find_by_mac(entry.first);
        if (!record || record->last_seen_ms >= entry.second) {
            continue;
        }
        record->last_seen_ms = entry.second;
        batch.push_back(*record);
    }
    if (batch.empty()) {
        return;
    }

    std::string error;
    if (!store_.save_all(batch, error)) {
        LOG_ERROR("[Fleet] Last-seen flush of " << batch.size() << " records failed: " << error);
        std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
        for (const auto &entry : pending) {
            // A newer value may have arrived meanwhile
            pending_last_seen_.emplace(entry.first, entry.second);
        }
        return;
    }
    LOG_DEBUG("[Fleet] Flushed last-seen for " << batch.size() << " devices");
}

void FleetController::teardown_all() {
    std::unique_lock<std::shared_mutex> lock(active_mutex_);
    for (auto &entry : active_) {
        close_connection(entry.first, entry.second);
    }
    active_.clear();
}

void FleetController::drain() {
    if (!running_.load() || std::this_thread::get_id() == writer_id_) {
        return;
    }
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!inbox_->push([done] { done->set_value(); })) {
        return;
    }
    future.wait();
}

int FleetController::on_update_changed(UpdateListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int id = next_listener_id_++;
    update_listeners_[id] = std::move(listener);
    return id;
}

void FleetController::remove_update_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    update_listeners_.erase(listener_id);
}

void FleetController::notify_update_listeners(const std::vector<Notification> &notifications) {
    if (notifications.empty()) {
        return;
    }
    std::vector<UpdateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto &entry : update_listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto &notification : notifications) {
        for (const auto &listener : listeners) {
            listener(notification.first, notification.second);
        }
    }
}

std::vector<FleetDeviceView> FleetController::devices() const {
    std::vector<FleetDeviceView> views;
    std::shared_lock<std::shared_mutex> lock(active_mutex_);
    views.reserve(active_.size());
    for (const auto &entry : active_) {
        const auto &device = entry.second;
        FleetDeviceView view;
        view.record = device.record;
        view.connected_address = device.address;
        view.live = device.connection->live_state();
        view.available_update = device.tracker.available();
        view.retry_count = device.connection->retry_count();
        view.reconnect_in = device.connection->pending_reconnect_delay();
        views.push_back(std::move(view));
    }
    return views;
}

std::optional<FleetDeviceView> FleetController::device(const std::string &mac_address) const {
    std::shared_lock<std::shared_mutex> lock(active_mutex_);
    auto it = active_.find(mac_address);
    if (it == active_.end()) {
        return std::nullopt;
    }
    const auto &device = it->second;
    FleetDeviceView view;
    view.record = device.record;
    view.connected_address = device.address;
    view.live = device.connection->live_state();
    view.available_update = device.tracker.available();
    view.retry_count = device.connection->retry_count();
    view.reconnect_in = device.connection->pending_reconnect_delay();
    return view;
}

std::set<std::string> FleetController::active_macs() const {
    std::set<std::string> macs;
    std::shared_lock<std::shared_mutex> lock(active_mutex_);
    for (const auto &entry : active_) {
        macs.insert(entry.first);
    }
    return macs;
}

size_t FleetController::active_count() const {
    std::shared_lock<std::shared_mutex> lock(active_mutex_);
    return active_.size();
}

size_t FleetController::pending_bookkeeping() const {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    return pending_last_seen_.size();
}

}  // namespace fleet
}  // namespace lightfleet
