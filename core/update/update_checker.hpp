#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/device_record.hpp"
#include "release/release_catalog.hpp"

namespace lightfleet {
namespace update {

// Marker firmware builds use for beta versions, e.g. "0.15.0-b2"
inline constexpr const char *kBetaMarker = "-b";
// Rolling tag that is never offered as an update
inline constexpr const char *kNightlyTag = "nightly";

// Orders two version strings. Runs of digits compare by numeric value, other
// characters by code point; if one string is a prefix of the other, the longer
// one is greater. Returns <0, 0 or >0.
int compare_versions(const std::string &lhs, const std::string &rhs);

bool is_beta_version(const std::string &version);

// Newest entry by published date, excluding the nightly tag and, for the
// stable branch, prereleases. Ties keep catalog order.
std::optional<release::ReleaseEntry> latest_release(const std::vector<release::ReleaseEntry> &catalog,
                                                    model::Branch branch);

// Tag to offer for a device running current_version, if any
std::optional<std::string> compute_update(const std::string &current_version, model::Branch branch,
                                          const std::string &skip_tag,
                                          const std::vector<release::ReleaseEntry> &catalog);

// Memoizes compute_update for one device. evaluate() reports a change only
// when the computed tag differs from the previous result.
class UpdateTracker {
public:
    struct Inputs {
        std::string current_version;
        model::Branch branch = model::Branch::UNKNOWN;
        std::string skip_tag;
        int64_t catalog_revision = -1;

        bool operator==(const Inputs &other) const {
            return current_version == other.current_version && branch == other.branch &&
                   skip_tag == other.skip_tag && catalog_revision == other.catalog_revision;
        }
    };

    // Returns true when the available tag changed
    bool evaluate(const Inputs &inputs, const std::vector<release::ReleaseEntry> &catalog);

    const std::optional<std::string> &available() const { return available_; }
    int evaluations() const { return evaluations_; }

private:
    std::optional<Inputs> last_inputs_;
    std::optional<std::string> available_;
    int evaluations_ = 0;
};

}  // namespace update
}  // namespace lightfleet
