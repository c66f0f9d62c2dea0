/**
 * @file test_config_source.cpp
 * @brief Unit tests for configuration sources and boolean parsing
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_adapter/config/config_source.h>

namespace kcenon::transfer_adapter::test {

class ConfigSourceTest : public ::testing::Test {
protected:
    memory_config_source config_;
};

TEST_F(ConfigSourceTest, GetReturnsValue) {
    config_.set("lfs.customtransfer.testagent.path", "/usr/bin/agent");

    auto value = config_.get("lfs.customtransfer.testagent.path");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "/usr/bin/agent");
    EXPECT_FALSE(config_.get("lfs.customtransfer.testagent.args").has_value());
}

TEST_F(ConfigSourceTest, UnsetRemovesKey) {
    config_.set("a.b", "1");
    config_.unset("a.b");
    EXPECT_FALSE(config_.get("a.b").has_value());
    EXPECT_TRUE(config_.entries().empty());
}

TEST_F(ConfigSourceTest, EntriesListsEverything) {
    memory_config_source config({{"a.x", "1"}, {"b.y", "2"}});
    auto entries = config.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries["b.y"], "2");
}

TEST_F(ConfigSourceTest, ParseBoolAcceptsGitSpellings) {
    for (const char* yes : {"true", "TRUE", "yes", "On", "1", ""}) {
        auto parsed = parse_bool(yes);
        ASSERT_TRUE(parsed.has_value()) << yes;
        EXPECT_TRUE(parsed.value()) << yes;
    }
    for (const char* no : {"false", "No", "OFF", "0"}) {
        auto parsed = parse_bool(no);
        ASSERT_TRUE(parsed.has_value()) << no;
        EXPECT_FALSE(parsed.value()) << no;
    }
}

TEST_F(ConfigSourceTest, ParseBoolRejectsOtherValues) {
    auto parsed = parse_bool("maybe");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_boolean);
}

TEST_F(ConfigSourceTest, GetBoolUsesDefaultWhenUnset) {
    auto unset = get_bool(config_, "lfs.customtransfer.x.concurrent", true);
    ASSERT_TRUE(unset.has_value());
    EXPECT_TRUE(unset.value());

    config_.set("lfs.customtransfer.x.concurrent", "false");
    auto set = get_bool(config_, "lfs.customtransfer.x.concurrent", true);
    ASSERT_TRUE(set.has_value());
    EXPECT_FALSE(set.value());
}

TEST_F(ConfigSourceTest, GetBoolNamesKeyInError) {
    config_.set("lfs.customtransfer.x.concurrent", "sometimes");
    auto parsed = get_bool(config_, "lfs.customtransfer.x.concurrent", true);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().message.find("lfs.customtransfer.x.concurrent"), std::string::npos);
}

}  // namespace kcenon::transfer_adapter::test
