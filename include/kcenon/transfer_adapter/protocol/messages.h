/**
 * @file messages.h
 * @brief Messages exchanged with custom transfer processes
 * @version 0.1.0
 *
 * Every message is one JSON object on one line. Field names are the wire
 * contract shared with third-party transfer agents and must not change:
 *
 * | Message            | Direction        | Fields                                    |
 * |--------------------|------------------|-------------------------------------------|
 * | init_request       | adapter -> agent | event, operation, concurrent, concurrenttransfers |
 * | init_response      | agent -> adapter | error?                                    |
 * | upload_request     | adapter -> agent | event, oid, size, path, action            |
 * | download_request   | adapter -> agent | event, oid, size, action                  |
 * | progress_response  | agent -> adapter | event?, oid, bytesSoFar, bytesSinceLast   |
 * | transfer_response  | agent -> adapter | event?, oid, path?, error?                |
 * | terminate_request  | adapter -> agent | event, complete                           |
 *
 * Inbound messages may carry extra fields; they are ignored.
 */

#ifndef KCENON_TRANSFER_ADAPTER_PROTOCOL_MESSAGES_H
#define KCENON_TRANSFER_ADAPTER_PROTOCOL_MESSAGES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "kcenon/transfer_adapter/core/transfer_types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief First message to a new process: operation and concurrency
 */
struct init_request {
    static constexpr std::string_view event_tag = "init";
    static constexpr std::string_view message_name = "init";

    std::string operation;
    bool concurrent = true;
    int concurrent_transfers = 0;
};

/**
 * @brief Reply to init_request; an error means the process refused to serve
 */
struct init_response {
    static constexpr std::string_view event_tag = "";
    static constexpr std::string_view message_name = "init response";

    std::optional<object_error> error;
};

struct upload_request {
    static constexpr std::string_view event_tag = "upload";
    static constexpr std::string_view message_name = "upload";

    std::string oid;
    int64_t size = 0;
    std::string path;
    action link;
};

struct download_request {
    static constexpr std::string_view event_tag = "download";
    static constexpr std::string_view message_name = "download";

    std::string oid;
    int64_t size = 0;
    action link;
};

/**
 * @brief Terminal reply for one transfer, shared by uploads and downloads
 *
 * `path` is only set for downloads: where the process left the content.
 */
struct transfer_response {
    static constexpr std::string_view event_tag = "complete";
    static constexpr std::string_view message_name = "complete";

    std::string oid;
    std::optional<std::string> path;
    std::optional<object_error> error;
};

/**
 * @brief Intermediate progress for one transfer
 */
struct progress_response {
    static constexpr std::string_view event_tag = "progress";
    static constexpr std::string_view message_name = "progress";

    std::string oid;
    int64_t bytes_so_far = 0;
    int64_t bytes_since_last = 0;
};

struct terminate_request {
    static constexpr std::string_view event_tag = "terminate";
    static constexpr std::string_view message_name = "terminate";

    bool complete = true;
};

void to_json(nlohmann::json& j, const object_error& e);
void from_json(const nlohmann::json& j, object_error& e);

void to_json(nlohmann::json& j, const action& a);
void from_json(const nlohmann::json& j, action& a);

void to_json(nlohmann::json& j, const init_request& m);
void from_json(const nlohmann::json& j, init_request& m);

void to_json(nlohmann::json& j, const init_response& m);
void from_json(const nlohmann::json& j, init_response& m);

void to_json(nlohmann::json& j, const upload_request& m);
void from_json(const nlohmann::json& j, upload_request& m);

void to_json(nlohmann::json& j, const download_request& m);
void from_json(const nlohmann::json& j, download_request& m);

void to_json(nlohmann::json& j, const transfer_response& m);
void from_json(const nlohmann::json& j, transfer_response& m);

void to_json(nlohmann::json& j, const progress_response& m);
void from_json(const nlohmann::json& j, progress_response& m);

void to_json(nlohmann::json& j, const terminate_request& m);
void from_json(const nlohmann::json& j, terminate_request& m);

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_PROTOCOL_MESSAGES_H
