#include "first_contact_resolver.hpp"

#include <algorithm>
#include <cctype>

#include "logging/logger.hpp"

namespace lightfleet {
namespace first_contact {

namespace {

FirstContactResult failure(FirstContactError error, const std::string &message) {
    FirstContactResult result;
    result.error = error;
    result.error_message = message;
    return result;
}

bool is_address_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_' || c == ':' || c == '[' ||
           c == ']' || c == '%';
}

bool valid_port(const std::string &text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    int port = std::stoi(text);
    return port >= 1 && port <= 65535;
}

}  // namespace

const char *first_contact_error_to_string(FirstContactError error) {
    switch (error) {
        case FirstContactError::NONE:
            return "NONE";
        case FirstContactError::INVALID_ADDRESS:
            return "INVALID_ADDRESS";
        case FirstContactError::NO_IDENTITY_REPORTED:
            return "NO_IDENTITY_REPORTED";
        case FirstContactError::NETWORK_ERROR:
            return "NETWORK_ERROR";
        case FirstContactError::STORE_ERROR:
            return "STORE_ERROR";
    }
    return "UNKNOWN";
}

FirstContactResolver::FirstContactResolver(registry::IDeviceStore &store,
                                           std::shared_ptr<IDeviceInfoClient> info_client)
    : store_(store), info_client_(std::move(info_client)) {}

std::string FirstContactResolver::sanitize_address(const std::string &raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    std::string address = begin < end ? std::string(begin, end) : std::string();

    auto scheme = address.find("://");
    if (scheme != std::string::npos) {
        address.erase(0, scheme + 3);
    }
    while (!address.empty() && address.back() == '/') {
        address.pop_back();
    }
    return address;
}

bool FirstContactResolver::validate_address(const std::string &address, std::string &error) {
    if (address.empty()) {
        error = "Address is empty";
        return false;
    }
    if (!std::all_of(address.begin(), address.end(), is_address_char)) {
        error = "Address contains invalid characters: " + address;
        return false;
    }

    if (address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close == 1) {
            error = "Malformed IPv6 address: " + address;
            return false;
        }
        if (close + 1 == address.size()) {
            return true;
        }
        if (address[close + 1] != ':' || !valid_port(address.substr(close + 2))) {
            error = "Invalid port in address: " + address;
            return false;
        }
        return true;
    }

    const auto colons = std::count(address.begin(), address.end(), ':');
    if (colons > 1) {
        error = "IPv6 addresses must be bracketed: " + address;
        return false;
    }
    if (address.find_first_of("[]") != std::string::npos) {
        error = "Unexpected bracket in address: " + address;
        return false;
    }
    if (colons == 1) {
        auto colon = address.find(':');
        if (colon == 0) {
            error = "Address has no host: " + address;
            return false;
        }
        if (!valid_port(address.substr(colon + 1))) {
            error = "Invalid port in address: " + address;
            return false;
        }
    }
    return true;
}

FirstContactResult FirstContactResolver::probe(const std::string &raw_address) {
    const std::string address = sanitize_address(raw_address);

    std::string error;
    if (!validate_address(address, error)) {
        LOG_WARN("[FirstContact] " << error);
        return failure(FirstContactError::INVALID_ADDRESS, error);
    }
    if (!info_client_) {
        return failure(FirstContactError::NETWORK_ERROR, "No device info client configured");
    }

    InfoFetchResult fetched = info_client_->fetch_info(address);
    if (!fetched.success) {
        LOG_WARN("[FirstContact] Could not reach " << address << ": " << fetched.error_message);
        return failure(FirstContactError::NETWORK_ERROR, fetched.error_message);
    }
    if (fetched.info.mac_address.empty()) {
        LOG_WARN("[FirstContact] " << address << " did not report a MAC address");
        return failure(FirstContactError::NO_IDENTITY_REPORTED, address + " did not report a MAC address");
    }

    FirstContactResult result;
    result.success = true;
    result.identity.mac_address = fetched.info.mac_address;
    result.identity.address = address;
    result.identity.reported_name = fetched.info.name;
    result.identity.version = fetched.info.version;
    return result;
}

FirstContactResult FirstContactResolver::upsert(const model::DeviceIdentity &identity) {
    if (identity.mac_address.empty()) {
        return failure(FirstContactError::NO_IDENTITY_REPORTED, "Identity has no MAC address");
    }

    FirstContactResult result;
    result.success = true;
    result.identity = identity;
    result.identity.created = false;
    result.identity.updated = false;

    std::string error;
    auto existing = store_.find_by_mac(identity.mac_address);
    if (!existing) {
        model::DeviceRecord record;
        record.mac_address = identity.mac_address;
        record.address = identity.address;
        record.original_name = identity.reported_name;
        record.is_hidden = false;
        if (!store_.save(record, error)) {
            return failure(FirstContactError::STORE_ERROR, error);
        }
        LOG_INFO("[FirstContact] New device " << record.mac_address << " (" << record.display_name() << ") at "
                                              << record.address);
        result.identity.created = true;
        return result;
    }

    if (existing->address == identity.address && existing->original_name == identity.reported_name) {
        LOG_DEBUG("[FirstContact] " << identity.mac_address << " unchanged");
        return result;
    }

    model::DeviceRecord patched = *existing;
    patched.address = identity.address;
    patched.original_name = identity.reported_name;
    if (!store_.save(patched, error)) {
        return failure(FirstContactError::STORE_ERROR, error);
    }
    LOG_INFO("[FirstContact] Updated " << identity.mac_address << ": address " << existing->address << " -> "
                                       << patched.address << ", name '" << existing->original_name << "' -> '"
                                       << patched.original_name << "'");
    result.identity.updated = true;
    return result;
}

FirstContactResult FirstContactResolver::resolve_and_upsert(const std::string &raw_address) {
    FirstContactResult probed = probe(raw_address);
    if (!probed.success) {
        return probed;
    }
    return upsert(probed.identity);
}

bool FirstContactResolver::fast_update_address(const std::optional<std::string> &mac_hint,
                                               const std::string &raw_address) {
    if (!mac_hint || mac_hint->empty()) {
        return false;
    }

    auto existing = store_.find_by_mac(*mac_hint);
    if (!existing) {
        return false;
    }

    const std::string address = sanitize_address(raw_address);
    if (address.empty() || existing->address == address) {
        return true;
    }

    model::DeviceRecord patched = *existing;
    patched.address = address;
    std::string error;
    if (!store_.save(patched, error)) {
        LOG_ERROR("[FirstContact] Address update for " << *mac_hint << " failed: " << error);
        return true;
    }
    LOG_INFO("[FirstContact] " << *mac_hint << " moved " << existing->address << " -> " << address);
    return true;
}

}  // namespace first_contact
}  // namespace lightfleet
