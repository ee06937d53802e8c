#include "release_catalog.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "logging/logger.hpp"

namespace lightfleet {
namespace release {

std::optional<int64_t> parse_iso8601_ms(const std::string &text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int64_t offset_s = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int off_h = 0, off_m = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
            return std::nullopt;
        }
        offset_s = (off_h * 3600 + off_m * 60) * (text[pos] == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const int64_t epoch_s = static_cast<int64_t>(timegm(&tm)) - offset_s;
    return epoch_s * 1000 + millis;
}

bool decode_github_releases(const std::string &body, std::vector<ReleaseEntry> &entries, std::string &error) {
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        error = "release list is not valid JSON";
        return false;
    }
    if (!json.is_array()) {
        error = "release list must be a JSON array";
        return false;
    }

    std::vector<ReleaseEntry> out;
    for (const auto &item : json) {
        if (!item.is_object()) {
            continue;
        }
        auto tag = item.find("tag_name");
        if (tag == item.end() || !tag->is_string() || tag->get<std::string>().empty()) {
            continue;
        }

        ReleaseEntry entry;
        entry.tag_name = tag->get<std::string>();
        if (entry.tag_name.size() > 1 && entry.tag_name[0] == 'v') {
            entry.tag_name.erase(0, 1);
        }
        if (item.contains("name") && item["name"].is_string()) {
            entry.name = item["name"].get<std::string>();
        }
        if (item.contains("prerelease") && item["prerelease"].is_boolean()) {
            entry.is_prerelease = item["prerelease"].get<bool>();
        }
        if (item.contains("html_url") && item["html_url"].is_string()) {
            entry.html_url = item["html_url"].get<std::string>();
        }
        if (item.contains("published_at") && item["published_at"].is_string()) {
            auto published = parse_iso8601_ms(item["published_at"].get<std::string>());
            if (published) {
                entry.published_at_ms = *published;
            } else {
                LOG_WARN("[Releases] Unparseable published_at for " << entry.tag_name);
            }
        }
        out.push_back(std::move(entry));
    }

    entries = std::move(out);
    return true;
}

std::vector<ReleaseEntry> ReleaseCatalog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t ReleaseCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

int64_t ReleaseCatalog::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

void ReleaseCatalog::replace(std::vector<ReleaseEntry> entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(entries);
    ++revision_;
    LOG_INFO("[Releases] Catalog replaced (" << entries_.size() << " release(s), revision " << revision_ << ")");
}

bool ReleaseCatalog::load_file(const std::string &path, std::string &error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARN("[Releases] Catalog file not found: " << path << " (no updates will be offered)");
        return true;
    }

    std::ifstream file(path);
    if (!file) {
        error = "Cannot open release catalog: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<ReleaseEntry> entries;
    if (!decode_github_releases(buffer.str(), entries, error)) {
        error = path + ": " + error;
        return false;
    }
    replace(std::move(entries));
    return true;
}

}  // namespace release
}  // namespace lightfleet
