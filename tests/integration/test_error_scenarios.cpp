/**
 * @file test_error_scenarios.cpp
 * @brief Failure handling with misbehaving transfer processes
 *
 * This file contains tests for:
 * - Processes that reject init or cannot be started
 * - Processes that crash, hang or violate the protocol mid-transfer
 * - Errors reported for single objects
 * - Cancellation of a running batch
 */

#include "test_fixtures.h"

#include <atomic>
#include <csignal>
#include <sstream>

namespace kcenon::transfer_adapter::test {

using namespace std::chrono_literals;

// =============================================================================
// Test Fixtures
// =============================================================================

class ErrorScenarioTest : public TempDirectoryFixture {
protected:
    /// Process ids logged by the agent for entries of the given kind
    auto logged_pids(const std::string& kind) const -> std::vector<pid_t> {
        std::vector<pid_t> pids;
        for (const auto& line : read_agent_log()) {
            if (line.rfind(kind + " ", 0) != 0) continue;
            auto last_space = line.find_last_of(' ');
            pids.push_back(static_cast<pid_t>(std::stol(line.substr(last_space + 1))));
        }
        return pids;
    }

    static auto is_alive(pid_t pid) -> bool { return ::kill(pid, 0) == 0; }

    /// Run a batch of uploads to completion and return the results
    auto run_uploads(custom_adapter& adapter, int concurrency, unsigned count)
        -> std::vector<transfer_result> {
        EXPECT_TRUE(adapter.begin(concurrency, nullptr, done_.callback()).has_value());
        for (unsigned i = 0; i < count; ++i) {
            EXPECT_TRUE(adapter.add(make_upload(create_object(256, i))).has_value());
        }
        adapter.end();
        return done_.results();
    }

    completion_recorder done_;
};

// =============================================================================
// Startup Failures
// =============================================================================

TEST_F(ErrorScenarioTest, InitErrorFailsEveryTransfer) {
    custom_adapter adapter(make_definition("testagent", "--init-error 'unsupported operation'"),
                           transfer_direction::upload);

    auto results = run_uploads(adapter, 2, 4);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_EQ(r.err->code, error_code::worker_unavailable);
        EXPECT_NE(r.err->message.find("unsupported operation"), std::string::npos)
            << r.err->message;
    }

    EXPECT_EQ(count_log_entries("transfer"), 0u);
    auto pids = logged_pids("init");
    EXPECT_EQ(pids.size(), 2u);
    for (auto pid : pids) {
        EXPECT_FALSE(is_alive(pid)) << pid;
    }
}

TEST_F(ErrorScenarioTest, MissingProgramFailsEveryTransfer) {
    adapter_definition def;
    def.name = "missing";
    def.path = (test_dir_ / "no-such-agent").string();
    custom_adapter adapter(def, transfer_direction::upload);

    auto results = run_uploads(adapter, 3, 3);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_EQ(r.err->code, error_code::worker_unavailable);
    }
}

// =============================================================================
// Mid-Transfer Failures
// =============================================================================

TEST_F(ErrorScenarioTest, CrashedProcessIsReplaced) {
    custom_adapter adapter(make_definition("testagent", "--crash"),
                           transfer_direction::upload);

    auto results = run_uploads(adapter, 1, 3);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_TRUE(is_worker_fatal(r.err->code)) << r.err->message;
    }

    // The first process plus one replacement after each crash
    EXPECT_EQ(count_log_entries("init"), 4u);
    EXPECT_EQ(count_log_entries("transfer"), 3u);
}

TEST_F(ErrorScenarioTest, GarbageResponseFailsTransfer) {
    custom_adapter adapter(make_definition("testagent", "--garbage"),
                           transfer_direction::upload);

    auto results = run_uploads(adapter, 1, 2);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_EQ(r.err->code, error_code::protocol_unparseable);
    }
    EXPECT_EQ(count_log_entries("init"), 3u);

    for (auto pid : logged_pids("init")) {
        EXPECT_FALSE(is_alive(pid)) << pid;
    }
}

TEST_F(ErrorScenarioTest, OidMismatchFailsTransfer) {
    custom_adapter adapter(make_definition("testagent", "--mismatch-oid"),
                           transfer_direction::upload);

    auto results = run_uploads(adapter, 1, 1);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_FALSE(results[0].succeeded());
    EXPECT_EQ(results[0].err->code, error_code::protocol_oid_mismatch);
    EXPECT_NE(results[0].err->message.find("Unexpected oid"), std::string::npos);
}

TEST_F(ErrorScenarioTest, ReadTimeoutFailsTransfer) {
    auto def = make_definition("testagent", "--hang");
    def.read_timeout = 300ms;
    custom_adapter adapter(def, transfer_direction::upload);

    auto results = run_uploads(adapter, 1, 1);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_FALSE(results[0].succeeded());
    EXPECT_EQ(results[0].err->code, error_code::protocol_timeout);

    for (auto pid : logged_pids("init")) {
        EXPECT_FALSE(is_alive(pid)) << pid;
    }
}

TEST_F(ErrorScenarioTest, ReportedErrorKeepsProcess) {
    std::atomic<int> verified{0};
    adapter_services services;
    services.verify_upload = [&](const transfer_object&) -> result<void> {
        ++verified;
        return {};
    };
    custom_adapter adapter(make_definition("testagent", "--fail-transfer 'object too large'"),
                           transfer_direction::upload, services);

    auto results = run_uploads(adapter, 1, 3);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_EQ(r.err->code, error_code::transfer_failed);
        EXPECT_NE(r.err->message.find("object too large"), std::string::npos);
    }
    EXPECT_EQ(verified.load(), 0);
    EXPECT_EQ(count_log_entries("init"), 1u);
    EXPECT_EQ(count_log_entries("terminate"), 1u);
}

TEST_F(ErrorScenarioTest, UnverifiedUploadFails) {
    auto oid = create_object(512);
    adapter_services services;
    services.verify_upload = [](const transfer_object&) -> result<void> {
        return unexpected{error{error_code::transfer_failed, "object missing on server"}};
    };
    custom_adapter adapter(make_definition("testagent"), transfer_direction::upload, services);

    ASSERT_TRUE(adapter.begin(1, nullptr, done_.callback()).has_value());
    ASSERT_TRUE(adapter.add(make_upload(oid)).has_value());
    adapter.end();

    auto results = done_.results();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_FALSE(results[0].succeeded());
    EXPECT_EQ(results[0].err->code, error_code::verification_failed);
}

TEST_F(ErrorScenarioTest, NonZeroExitAfterTerminateDoesNotFailBatch) {
    custom_adapter adapter(make_definition("testagent", "--exit-code 7"),
                           transfer_direction::upload);

    auto results = run_uploads(adapter, 1, 2);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.succeeded()) << r.err->message;
    }
    EXPECT_EQ(count_log_entries("terminate"), 1u);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ErrorScenarioTest, CancelStopsHungProcess) {
    custom_adapter adapter(make_definition("testagent", "--hang"),
                           transfer_direction::upload);
    ASSERT_TRUE(adapter.begin(2, nullptr, done_.callback()).has_value());

    for (unsigned i = 0; i < 4; ++i) {
        ASSERT_TRUE(adapter.add(make_upload(create_object(128, i))).has_value());
    }
    ASSERT_TRUE(wait_for_log_entries("transfer", 1));

    adapter.cancel();
    adapter.end();

    auto results = done_.results();
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        ASSERT_FALSE(r.succeeded());
        EXPECT_EQ(r.err->code, error_code::transfer_cancelled);
    }

    for (auto pid : logged_pids("transfer")) {
        EXPECT_FALSE(is_alive(pid)) << pid;
    }
}

TEST_F(ErrorScenarioTest, AddAfterCancelIsReportedCancelled) {
    custom_adapter adapter(make_definition("testagent"), transfer_direction::upload);
    ASSERT_TRUE(adapter.begin(1, nullptr, done_.callback()).has_value());
    adapter.cancel();

    ASSERT_TRUE(adapter.add(make_upload(create_object(64))).has_value());
    adapter.end();

    auto results = done_.results();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_FALSE(results[0].succeeded());
    EXPECT_EQ(results[0].err->code, error_code::transfer_cancelled);
    EXPECT_EQ(count_log_entries("transfer"), 0u);
}

}  // namespace kcenon::transfer_adapter::test
