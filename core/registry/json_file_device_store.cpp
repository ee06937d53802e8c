#include "json_file_device_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "logging/logger.hpp"
#include "store_migration.hpp"

namespace lightfleet {
namespace registry {

namespace fs = std::filesystem;

JsonFileDeviceStore::JsonFileDeviceStore(std::string path) : path_(std::move(path)) {}

bool JsonFileDeviceStore::load(std::string &error) {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LOG_INFO("[Store] No store at " << path_ << ", starting empty");
        seed({});
        return true;
    }

    std::ifstream file(path_);
    if (!file) {
        error = "Cannot open device store: " + path_;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        error = "Device store is not a JSON object: " + path_;
        return false;
    }

    int version = 1;
    if (doc.contains("version")) {
        if (!doc["version"].is_number_integer()) {
            error = "Device store 'version' must be an integer";
            return false;
        }
        version = doc["version"].get<int>();
    }

    const nlohmann::json devices = doc.contains("devices") ? doc["devices"] : nlohmann::json::array();
    if (!devices.is_array()) {
        error = "Device store 'devices' must be an array";
        return false;
    }

    std::vector<model::DeviceRecord> records;
    if (version == 1) {
        if (!load_legacy(devices, records, error)) {
            return false;
        }
        if (!write_file(records, error)) {
            return false;
        }
    } else if (version == kFormatVersion) {
        for (const auto &entry : devices) {
            model::DeviceRecord record;
            std::string record_error;
            if (!model::decode_record(entry, record, record_error)) {
                error = "Device store entry invalid: " + record_error;
                return false;
            }
            records.push_back(std::move(record));
        }
    } else {
        error = "Unsupported device store version " + std::to_string(version);
        return false;
    }

    seed(records);
    LOG_INFO("[Store] Loaded " << records.size() << " device(s) from " << path_);
    return true;
}

bool JsonFileDeviceStore::persist(const std::vector<model::DeviceRecord> &records, std::string &error) {
    return write_file(records, error);
}

bool JsonFileDeviceStore::load_legacy(const nlohmann::json &devices, std::vector<model::DeviceRecord> &records,
                                      std::string &error) {
    std::vector<LegacyDeviceRecord> legacy;
    for (const auto &entry : devices) {
        LegacyDeviceRecord record;
        if (!decode_legacy_record(entry, record, error)) {
            return false;
        }
        legacy.push_back(std::move(record));
    }

    MigrationReport report;
    records = migrate_legacy_records(legacy, &report);
    LOG_INFO("[Store] Migrated version 1 store: " << report.migrated << " kept, " << report.dropped_invalid_mac
                                                   << " without MAC, " << report.dropped_duplicates
                                                   << " duplicate(s) dropped");
    return true;
}

bool JsonFileDeviceStore::write_file(const std::vector<model::DeviceRecord> &records, std::string &error) {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto &record : records) {
        devices.push_back(model::encode_record(record));
    }
    nlohmann::json doc = {{"version", kFormatVersion}, {"devices", devices}};

    const fs::path target(path_);
    const fs::path temp = target.string() + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            error = "Cannot write " + temp.string();
            return false;
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out) {
            error = "Write failed for " + temp.string();
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        error = "Cannot replace " + path_ + ": " + ec.message();
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

}  // namespace registry
}  // namespace lightfleet
