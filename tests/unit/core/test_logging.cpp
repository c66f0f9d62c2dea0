/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_adapter/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::transfer_adapter::test {

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = R"(object at /home/user/.git/lfs/objects/ab/cd {"Authorization":"Bearer x"})";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskCredentialHeaders) {
    masking_config config;
    config.mask_credentials = true;
    sensitive_info_masker masker(config);

    auto masked = masker.mask(
        R"({"header":{"Authorization":"Bearer secret","X-Session-Token":"t0ken","Accept":"json"}})");

    EXPECT_EQ(masked.find("secret"), std::string::npos);
    EXPECT_EQ(masked.find("t0ken"), std::string::npos);
    EXPECT_NE(masked.find(R"("Authorization":"***")"), std::string::npos);
    EXPECT_NE(masked.find(R"("Accept":"json")"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathKeepsName) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto masked = masker.mask_path("/home/user/object.bin");

    EXPECT_EQ(masked.find("/home/user"), std::string::npos);
    EXPECT_NE(masked.find("object.bin"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto masked = masker.mask("cannot open /var/tmp/lfs/abc123 for reading");

    EXPECT_EQ(masked.find("/var/tmp/lfs"), std::string::npos);
    EXPECT_NE(masked.find("abc123"), std::string::npos);
    EXPECT_NE(masked.find("cannot open"), std::string::npos);
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, FieldsToJson) {
    transfer_log_context ctx;
    ctx.adapter = "testagent";
    ctx.oid = "abc";
    ctx.worker_id = 2;
    ctx.pid = 4242;
    ctx.size = 1024;
    ctx.bytes_so_far = 512;
    ctx.duration_ms = 30;

    auto json = ctx.to_json();

    EXPECT_NE(json.find(R"("adapter":"testagent")"), std::string::npos);
    EXPECT_NE(json.find(R"("oid":"abc")"), std::string::npos);
    EXPECT_NE(json.find(R"("worker_id":2)"), std::string::npos);
    EXPECT_NE(json.find(R"("pid":4242)"), std::string::npos);
    EXPECT_NE(json.find(R"("size":1024)"), std::string::npos);
    EXPECT_NE(json.find(R"("bytes_so_far":512)"), std::string::npos);
    EXPECT_NE(json.find(R"("duration_ms":30)"), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.error_message = "bad \"line\"\nnext";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
}

TEST_F(TransferLogContextTest, ErrorMessageIsMasked) {
    transfer_log_context ctx;
    ctx.error_message = "cannot open /home/user/secret.bin";

    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    EXPECT_EQ(ctx.to_json_with_masking(&masker).find("/home/user/"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsContext) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::worker)
        .with_message("worker could not start")
        .with_adapter("testagent")
        .with_worker_id(1)
        .with_error_message("no such file")
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, log_category::worker);
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->adapter, "testagent");
    EXPECT_EQ(entry.context->worker_id.value_or(-1), 1);
    EXPECT_EQ(entry.context->error_message.value_or(""), "no such file");
}

TEST_F(LogEntryBuilderTest, JsonIncludesSource) {
    auto json = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::transfer)
        .with_message("transfer complete")
        .with_oid("abc")
        .with_source_location("custom_adapter.cpp", 10, "do_transfer")
        .build_json();

    EXPECT_NE(json.find(R"("level":"INFO")"), std::string::npos);
    EXPECT_NE(json.find(R"("category":"transfer_adapter.transfer")"), std::string::npos);
    EXPECT_NE(json.find(R"("oid":"abc")"), std::string::npos);
    EXPECT_NE(json.find(R"("function":"do_transfer")"), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().build();
    // 2026-01-01T00:00:00.000Z
    ASSERT_EQ(entry.timestamp.size(), 24u);
    EXPECT_EQ(entry.timestamp[10], 'T');
    EXPECT_EQ(entry.timestamp.back(), 'Z');
}

// =============================================================================
// Logger Tests
// =============================================================================

class TransferAdapterLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_level(log_level::info);
    }
};

TEST_F(TransferAdapterLoggerTest, LevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(TransferAdapterLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    TA_LOG_INFO(log_category::registry, "registered custom transfer");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::registry);
    EXPECT_EQ(std::get<2>(captured[0]), "registered custom transfer");
}

TEST_F(TransferAdapterLoggerTest, LevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(message);
    });
    get_logger().set_level(log_level::warn);

    TA_LOG_TRACE(log_category::protocol, "trace");
    TA_LOG_DEBUG(log_category::worker, "debug");
    TA_LOG_INFO(log_category::adapter, "info");
    TA_LOG_WARN(log_category::worker, "warn");
    TA_LOG_ERROR(log_category::worker, "error");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "warn");
    EXPECT_EQ(captured[1], "error");
}

TEST_F(TransferAdapterLoggerTest, JsonCallbackWithContext) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    transfer_log_context ctx;
    ctx.adapter = "testagent";
    ctx.worker_id = 3;
    TA_LOG_WARN_CTX(log_category::worker, "restarting worker", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find(R"("message":"restarting worker")"), std::string::npos);
    EXPECT_NE(captured_json[0].find(R"("adapter":"testagent")"), std::string::npos);
    EXPECT_NE(captured_json[0].find(R"("worker_id":3)"), std::string::npos);
}

TEST_F(TransferAdapterLoggerTest, MaskingInJsonOutput) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_masking_config(masking_config::all_masked());
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    TA_LOG_TRACE(log_category::protocol,
                 R"(-> {"event":"upload","action":{"header":{"Authorization":"Bearer s3cr3t"}}})");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_EQ(captured_json[0].find("s3cr3t"), std::string::npos);
}

}  // namespace kcenon::transfer_adapter::test
