#include "update_checker.hpp"

#include <cctype>

namespace lightfleet {
namespace update {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Compares the digit runs starting at lhs[i] and rhs[j] by value and advances
// both indices past them
int compare_digit_runs(const std::string &lhs, size_t &i, const std::string &rhs, size_t &j) {
    while (i < lhs.size() && lhs[i] == '0') ++i;
    while (j < rhs.size() && rhs[j] == '0') ++j;

    size_t lhs_start = i;
    size_t rhs_start = j;
    while (i < lhs.size() && is_digit(lhs[i])) ++i;
    while (j < rhs.size() && is_digit(rhs[j])) ++j;

    size_t lhs_len = i - lhs_start;
    size_t rhs_len = j - rhs_start;
    if (lhs_len != rhs_len) {
        return lhs_len < rhs_len ? -1 : 1;
    }
    int cmp = lhs.compare(lhs_start, lhs_len, rhs, rhs_start, rhs_len);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

}  // namespace

int compare_versions(const std::string &lhs, const std::string &rhs) {
    size_t i = 0;
    size_t j = 0;
    while (i < lhs.size() && j < rhs.size()) {
        if (is_digit(lhs[i]) && is_digit(rhs[j])) {
            int cmp = compare_digit_runs(lhs, i, rhs, j);
            if (cmp != 0) {
                return cmp;
            }
            continue;
        }

        unsigned char a = static_cast<unsigned char>(lhs[i]);
        unsigned char b = static_cast<unsigned char>(rhs[j]);
        if (a != b) {
            return a < b ? -1 : 1;
        }
        ++i;
        ++j;
    }

    if (i < lhs.size()) return 1;
    if (j < rhs.size()) return -1;
    return 0;
}

bool is_beta_version(const std::string &version) { return version.find(kBetaMarker) != std::string::npos; }

std::optional<release::ReleaseEntry> latest_release(const std::vector<release::ReleaseEntry> &catalog,
                                                    model::Branch branch) {
    const release::ReleaseEntry *best = nullptr;
    for (const auto &entry : catalog) {
        if (entry.tag_name == kNightlyTag) {
            continue;
        }
        if (branch == model::Branch::STABLE && entry.is_prerelease) {
            continue;
        }
        if (best == nullptr || entry.published_at_ms > best->published_at_ms) {
            best = &entry;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::optional<std::string> compute_update(const std::string &current_version, model::Branch branch,
                                          const std::string &skip_tag,
                                          const std::vector<release::ReleaseEntry> &catalog) {
    if (current_version.empty()) {
        return std::nullopt;
    }

    auto candidate = latest_release(catalog, branch);
    if (!candidate || candidate->tag_name == skip_tag) {
        return std::nullopt;
    }

    // A beta build on the stable branch is always offered the stable release
    if (branch == model::Branch::STABLE && is_beta_version(current_version)) {
        return candidate->tag_name;
    }

    if (compare_versions(candidate->tag_name, current_version) > 0) {
        return candidate->tag_name;
    }
    return std::nullopt;
}

bool UpdateTracker::evaluate(const Inputs &inputs, const std::vector<release::ReleaseEntry> &catalog) {
    if (last_inputs_ && *last_inputs_ == inputs) {
        return false;
    }
    last_inputs_ = inputs;
    ++evaluations_;

    auto result = compute_update(inputs.current_version, inputs.branch, inputs.skip_tag, catalog);
    if (result == available_) {
        return false;
    }
    available_ = std::move(result);
    return true;
}

}  // namespace update
}  // namespace lightfleet
