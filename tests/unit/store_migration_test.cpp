#include "registry/store_migration.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace lightfleet;
using namespace lightfleet::registry;

namespace {

LegacyDeviceRecord legacy(std::optional<std::string> mac, const std::string &address, const std::string &name,
                          bool is_custom = false) {
    LegacyDeviceRecord record;
    record.mac_address = std::move(mac);
    record.address = address;
    record.name = name;
    record.is_custom_name = is_custom;
    return record;
}

}  // namespace

TEST(StoreMigrationTest, NameSplitFollowsCustomFlag) {
    auto out = migrate_legacy_records({legacy(std::string("aa"), "h1", "Mine", true),
                                       legacy(std::string("bb"), "h2", "WLED", false)});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].custom_name, "Mine");
    EXPECT_TRUE(out[0].original_name.empty());
    EXPECT_TRUE(out[1].custom_name.empty());
    EXPECT_EQ(out[1].original_name, "WLED");
}

TEST(StoreMigrationTest, NewFieldsStartAtDefaults) {
    auto source = legacy(std::string("aa"), "h1", "n");
    source.is_hidden = true;
    source.skip_update_tag = "0.14.1";

    auto out = migrate_legacy_records({source});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].branch, model::Branch::UNKNOWN);
    EXPECT_EQ(out[0].last_seen_ms, 0);
    EXPECT_TRUE(out[0].is_hidden);
    EXPECT_EQ(out[0].skip_update_tag, "0.14.1");
}

TEST(StoreMigrationTest, DropsEntriesWithoutUsableMac) {
    MigrationReport report;
    auto out = migrate_legacy_records({legacy(std::nullopt, "h1", "a"), legacy(std::string(""), "h2", "b"),
                                       legacy(std::string(kUnknownMacPlaceholder), "h3", "c"),
                                       legacy(std::string("dd"), "h4", "d")},
                                      &report);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].mac_address, "dd");
    EXPECT_EQ(report.dropped_invalid_mac, 3u);
    EXPECT_EQ(report.migrated, 1u);
}

TEST(StoreMigrationTest, FirstDuplicateWinsWithoutMerge) {
    auto first = legacy(std::string("aa"), "h1", "First", true);
    auto second = legacy(std::string("aa"), "h2", "Second", false);
    second.is_hidden = true;

    MigrationReport report;
    auto out = migrate_legacy_records({first, second}, &report);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].address, "h1");
    EXPECT_EQ(out[0].custom_name, "First");
    EXPECT_TRUE(out[0].original_name.empty());
    EXPECT_FALSE(out[0].is_hidden);
    EXPECT_EQ(report.dropped_duplicates, 1u);
}

TEST(StoreMigrationTest, DecodeLegacyRecord) {
    LegacyDeviceRecord record;
    std::string error;
    ASSERT_TRUE(decode_legacy_record(
        nlohmann::json{{"mac_address", "aa"}, {"address", "h"}, {"name", "n"}, {"is_custom_name", true}}, record,
        error))
        << error;
    ASSERT_TRUE(record.mac_address.has_value());
    EXPECT_EQ(*record.mac_address, "aa");
    EXPECT_TRUE(record.is_custom_name);

    ASSERT_TRUE(decode_legacy_record(nlohmann::json{{"mac_address", nullptr}, {"address", "h"}}, record, error));
    EXPECT_FALSE(record.mac_address.has_value());

    EXPECT_FALSE(decode_legacy_record(nlohmann::json("string"), record, error));
}

TEST(StoreMigrationTest, NullFieldsDecodeAsEmpty) {
    LegacyDeviceRecord record;
    std::string error;
    ASSERT_TRUE(decode_legacy_record(nlohmann::json::parse(R"({"mac_address": "aabbccddeeff", "address": "10.0.0.5",
                                                             "name": null, "is_hidden": null,
                                                             "skip_update_tag": null})"),
                                     record, error))
        << error;
    EXPECT_EQ(record.address, "10.0.0.5");
    EXPECT_TRUE(record.name.empty());
    EXPECT_FALSE(record.is_hidden);
    EXPECT_TRUE(record.skip_update_tag.empty());

    ASSERT_TRUE(decode_legacy_record(
        nlohmann::json::parse(R"({"mac_address": "aabbccddeeff", "address": null, "name": "Porch"})"), record, error))
        << error;
    EXPECT_TRUE(record.address.empty());
    EXPECT_EQ(record.name, "Porch");

    auto migrated = migrate_legacy_records({record});
    ASSERT_EQ(migrated.size(), 1u);
    EXPECT_EQ(migrated[0].original_name, "Porch");
    EXPECT_TRUE(migrated[0].address.empty());
}
