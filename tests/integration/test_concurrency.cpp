/**
 * @file test_concurrency.cpp
 * @brief Worker process concurrency tests
 *
 * This file contains tests for:
 * - One transfer process per worker
 * - Serial definitions running a single process
 * - Transfers spread across worker processes
 * - Repeated batches on one adapter
 */

#include "test_fixtures.h"

#include <set>
#include <sstream>

namespace kcenon::transfer_adapter::test {

// =============================================================================
// Concurrency Test Fixtures
// =============================================================================

class ConcurrencyTest : public TempDirectoryFixture {
protected:
    /// Field `index` of each agent log line of the given kind
    auto log_fields(const std::string& kind, std::size_t index) const
        -> std::vector<std::string> {
        std::vector<std::string> fields;
        for (const auto& line : read_agent_log()) {
            std::istringstream in(line);
            std::vector<std::string> parts;
            std::string part;
            while (in >> part) {
                parts.push_back(part);
            }
            if (!parts.empty() && parts[0] == kind && index < parts.size()) {
                fields.push_back(parts[index]);
            }
        }
        return fields;
    }

    completion_recorder done_;
};

// =============================================================================
// Worker Count Tests
// =============================================================================

TEST_F(ConcurrencyTest, OneProcessPerWorker) {
    custom_adapter adapter(make_definition("testagent"), transfer_direction::upload);
    ASSERT_TRUE(adapter.begin(4, nullptr, done_.callback()).has_value());
    EXPECT_EQ(adapter.worker_count(), 4);
    ASSERT_TRUE(wait_for_log_entries("init", 4));
    adapter.end();

    // init <operation> <concurrent> <concurrenttransfers> <pid>
    EXPECT_EQ(log_fields("init", 1), std::vector<std::string>(4, "upload"));
    EXPECT_EQ(log_fields("init", 2), std::vector<std::string>(4, "true"));
    EXPECT_EQ(log_fields("init", 3), std::vector<std::string>(4, "4"));

    auto pids = log_fields("init", 4);
    EXPECT_EQ(std::set<std::string>(pids.begin(), pids.end()).size(), 4u);
    EXPECT_EQ(count_log_entries("terminate"), 4u);
}

TEST_F(ConcurrencyTest, SerialDefinitionRunsOneProcess) {
    auto def = make_definition("testagent");
    def.concurrent = false;
    custom_adapter adapter(def, transfer_direction::upload);
    ASSERT_TRUE(adapter.begin(4, nullptr, done_.callback()).has_value());
    EXPECT_EQ(adapter.worker_count(), 1);

    for (unsigned i = 0; i < 6; ++i) {
        ASSERT_TRUE(adapter.add(make_upload(create_object(256, i))).has_value());
    }
    adapter.end();

    EXPECT_EQ(done_.count(), 6u);
    EXPECT_EQ(done_.failures(), 0u);
    EXPECT_EQ(count_log_entries("init"), 1u);
    EXPECT_EQ(log_fields("init", 2), std::vector<std::string>{"false"});
    EXPECT_EQ(log_fields("init", 3), std::vector<std::string>{"4"});

    auto pids = log_fields("transfer", 2);
    EXPECT_EQ(std::set<std::string>(pids.begin(), pids.end()).size(), 1u);
}

TEST_F(ConcurrencyTest, TransfersSpreadAcrossProcesses) {
    custom_adapter adapter(make_definition("testagent", "--delay-ms 50"),
                           transfer_direction::upload);
    ASSERT_TRUE(adapter.begin(3, nullptr, done_.callback()).has_value());

    constexpr unsigned count = 12;
    for (unsigned i = 0; i < count; ++i) {
        ASSERT_TRUE(adapter.add(make_upload(create_object(512, i))).has_value());
    }
    adapter.end();

    EXPECT_EQ(done_.count(), count);
    EXPECT_EQ(done_.failures(), 0u);

    auto pids = log_fields("transfer", 2);
    EXPECT_EQ(pids.size(), count);
    EXPECT_GT(std::set<std::string>(pids.begin(), pids.end()).size(), 1u);

    std::set<std::string> seen;
    for (const auto& r : done_.results()) {
        EXPECT_TRUE(seen.insert(r.oid).second) << "completed twice: " << r.oid;
    }
}

TEST_F(ConcurrencyTest, RepeatedBatchesRestartProcesses) {
    custom_adapter adapter(make_definition("testagent"), transfer_direction::upload);

    for (unsigned batch = 0; batch < 3; ++batch) {
        ASSERT_TRUE(adapter.begin(2, nullptr, done_.callback()).has_value());
        ASSERT_TRUE(adapter.add(make_upload(create_object(128, batch))).has_value());
        adapter.end();
    }

    EXPECT_EQ(done_.count(), 3u);
    EXPECT_EQ(done_.failures(), 0u);
    EXPECT_EQ(count_log_entries("init"), 6u);
    EXPECT_EQ(count_log_entries("terminate"), 6u);
}

}  // namespace kcenon::transfer_adapter::test
