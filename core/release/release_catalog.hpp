#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lightfleet {
namespace release {

struct ReleaseEntry {
    std::string tag_name;  // without a leading "v"
    std::string name;
    bool is_prerelease = false;
    int64_t published_at_ms = 0;  // 0 when the source had no usable date
    std::string html_url;
};

// Parses "YYYY-MM-DDTHH:MM:SS[.fff](Z|+hh:mm|-hh:mm)" to epoch milliseconds
std::optional<int64_t> parse_iso8601_ms(const std::string &text);

// Decodes a GitHub "list releases" response body. Entries without a tag are
// skipped; a leading "v" is stripped from tags.
bool decode_github_releases(const std::string &body, std::vector<ReleaseEntry> &entries, std::string &error);

// Thread-safe holder of the known firmware releases
class ReleaseCatalog {
public:
    ReleaseCatalog() = default;

    std::vector<ReleaseEntry> entries() const;
    size_t size() const;
    int64_t revision() const;

    void replace(std::vector<ReleaseEntry> entries);

    // Missing file: catalog left unchanged, returns true and logs.
    bool load_file(const std::string &path, std::string &error);

private:
    mutable std::mutex mutex_;
    std::vector<ReleaseEntry> entries_;
    int64_t revision_ = 0;
};

}  // namespace release
}  // namespace lightfleet
