#include "device_store.hpp"

#include <set>

#include "logging/logger.hpp"

namespace lightfleet {
namespace registry {

const char *store_change_kind_to_string(StoreChangeKind kind) {
    switch (kind) {
        case StoreChangeKind::INSERTED:
            return "INSERTED";
        case StoreChangeKind::UPDATED:
            return "UPDATED";
        case StoreChangeKind::DELETED:
            return "DELETED";
    }
    return "UNKNOWN";
}

std::vector<model::DeviceRecord> DeviceStore::fetch_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshot_locked(records_);
}

std::optional<model::DeviceRecord> DeviceStore::find_by_mac(const std::string &mac_address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(mac_address);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DeviceStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

bool DeviceStore::save(const model::DeviceRecord &record, std::string &error) {
    return save_all({record}, error);
}

bool DeviceStore::save_all(const std::vector<model::DeviceRecord> &records, std::string &error) {
    std::set<std::string> seen;
    for (const auto &record : records) {
        if (record.mac_address.empty()) {
            error = "Device record has no MAC address";
            return false;
        }
        if (!seen.insert(record.mac_address).second) {
            error = "Duplicate MAC address in batch: " + record.mac_address;
            return false;
        }
    }

    std::vector<StoreChange> changes;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        RecordMap next = records_;
        for (const auto &record : records) {
            auto it = next.find(record.mac_address);
            if (it == next.end()) {
                next.emplace(record.mac_address, record);
                changes.push_back({StoreChangeKind::INSERTED, record});
            } else if (it->second != record) {
                it->second = record;
                changes.push_back({StoreChangeKind::UPDATED, record});
            }
        }

        if (changes.empty()) {
            return true;
        }
        if (!commit_locked(std::move(next), changes, error)) {
            return false;
        }
    }

    notify(changes);
    return true;
}

bool DeviceStore::remove(const std::string &mac_address, std::string &error) {
    std::vector<StoreChange> changes;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = records_.find(mac_address);
        if (it == records_.end()) {
            error = "Device not found: " + mac_address;
            return false;
        }

        RecordMap next = records_;
        changes.push_back({StoreChangeKind::DELETED, it->second});
        next.erase(mac_address);
        if (!commit_locked(std::move(next), changes, error)) {
            return false;
        }
    }

    notify(changes);
    return true;
}

int DeviceStore::add_listener(StoreListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void DeviceStore::remove_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

bool DeviceStore::persist(const std::vector<model::DeviceRecord> &, std::string &) { return true; }

void DeviceStore::seed(const std::vector<model::DeviceRecord> &records) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    for (const auto &record : records) {
        records_.emplace(record.mac_address, record);
    }
}

bool DeviceStore::commit_locked(RecordMap next, const std::vector<StoreChange> &changes, std::string &error) {
    std::string persist_error;
    if (!persist(snapshot_locked(next), persist_error)) {
        error = "Failed to persist device store: " + persist_error;
        LOG_ERROR("[Store] " << error << " (" << changes.size() << " change(s) rolled back)");
        return false;
    }

    records_ = std::move(next);
    for (const auto &change : changes) {
        LOG_DEBUG("[Store] " << store_change_kind_to_string(change.kind) << " " << change.record.mac_address);
    }
    return true;
}

std::vector<model::DeviceRecord> DeviceStore::snapshot_locked(const RecordMap &map) const {
    std::vector<model::DeviceRecord> out;
    out.reserve(map.size());
    for (const auto &entry : map) {
        out.push_back(entry.second);
    }
    return out;
}

void DeviceStore::notify(const std::vector<StoreChange> &changes) {
    std::vector<StoreListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto &entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto &listener : listeners) {
        listener(changes);
    }
}

}  // namespace registry
}  // namespace lightfleet
