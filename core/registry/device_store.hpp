#ifndef LIGHTFLEET_REGISTRY_DEVICE_STORE_HPP
#define LIGHTFLEET_REGISTRY_DEVICE_STORE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "model/device_record.hpp"

namespace lightfleet {
namespace registry {

enum class StoreChangeKind { INSERTED, UPDATED, DELETED };

const char *store_change_kind_to_string(StoreChangeKind kind);

struct StoreChange {
    StoreChangeKind kind;
    model::DeviceRecord record;  // DELETED carries the record as it was
};

// Receives every committed batch of changes, after the store lock is released
using StoreListener = std::function<void(const std::vector<StoreChange> &)>;

// Persistent set of Device Records, keyed by MAC address.
//
// Readers get copies. Writers are serialized; a write that cannot be persisted
// leaves the store unchanged. Writing a record identical to the stored one is
// not a change and is not notified.
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    virtual std::vector<model::DeviceRecord> fetch_all() const = 0;
    virtual std::optional<model::DeviceRecord> find_by_mac(const std::string &mac_address) const = 0;
    virtual size_t size() const = 0;

    // Upsert by MAC
    virtual bool save(const model::DeviceRecord &record, std::string &error) = 0;
    // All records are committed together or not at all
    virtual bool save_all(const std::vector<model::DeviceRecord> &records, std::string &error) = 0;
    virtual bool remove(const std::string &mac_address, std::string &error) = 0;

    virtual int add_listener(StoreListener listener) = 0;
    virtual void remove_listener(int listener_id) = 0;
};

// In-memory store. Subclasses persist by overriding persist(), which runs
// under the write lock with the full post-change record set.
class DeviceStore : public IDeviceStore {
public:
    DeviceStore() = default;
    ~DeviceStore() override = default;

    DeviceStore(const DeviceStore &) = delete;
    DeviceStore &operator=(const DeviceStore &) = delete;

    std::vector<model::DeviceRecord> fetch_all() const override;
    std::optional<model::DeviceRecord> find_by_mac(const std::string &mac_address) const override;
    size_t size() const override;

    bool save(const model::DeviceRecord &record, std::string &error) override;
    bool save_all(const std::vector<model::DeviceRecord> &records, std::string &error) override;
    bool remove(const std::string &mac_address, std::string &error) override;

    int add_listener(StoreListener listener) override;
    void remove_listener(int listener_id) override;

protected:
    virtual bool persist(const std::vector<model::DeviceRecord> &records, std::string &error);

    // Replaces the contents without persisting or notifying (initial load)
    void seed(const std::vector<model::DeviceRecord> &records);

private:
    using RecordMap = std::map<std::string, model::DeviceRecord>;

    // Persists next and swaps it in. Caller holds the write lock.
    bool commit_locked(RecordMap next, const std::vector<StoreChange> &changes, std::string &error);
    std::vector<model::DeviceRecord> snapshot_locked(const RecordMap &map) const;
    void notify(const std::vector<StoreChange> &changes);

    mutable std::shared_mutex mutex_;
    RecordMap records_;

    std::mutex listeners_mutex_;
    std::map<int, StoreListener> listeners_;
    int next_listener_id_ = 1;
};

}  // namespace registry
}  // namespace lightfleet

#endif  // LIGHTFLEET_REGISTRY_DEVICE_STORE_HPP
