#pragma once

#include <string>

#include "device_store.hpp"

namespace lightfleet {
namespace registry {

// Device store persisted as a JSON document:
//
//   {"version": 2, "devices": [ {record}, ... ]}
//
// Version 1 files are migrated on load and rewritten in the current format.
// Every committed change rewrites the whole file through a temporary file
// and a rename.
class JsonFileDeviceStore : public DeviceStore {
public:
    static constexpr int kFormatVersion = 2;

    explicit JsonFileDeviceStore(std::string path);

    // A missing file is an empty store
    bool load(std::string &error);

    const std::string &path() const { return path_; }

protected:
    bool persist(const std::vector<model::DeviceRecord> &records, std::string &error) override;

private:
    bool load_legacy(const nlohmann::json &devices, std::vector<model::DeviceRecord> &records, std::string &error);
    bool write_file(const std::vector<model::DeviceRecord> &records, std::string &error);

    std::string path_;
};

}  // namespace registry
}  // namespace lightfleet
