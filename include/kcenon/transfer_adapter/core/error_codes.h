/**
 * @file error_codes.h
 * @brief Error codes for transfer_adapter_system (-800 to -899 range)
 * @version 0.1.0
 *
 * Error codes follow the -800 to -899 range reserved for this system.
 */

#ifndef KCENON_TRANSFER_ADAPTER_CORE_ERROR_CODES_H
#define KCENON_TRANSFER_ADAPTER_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::transfer_adapter {

/**
 * @brief Error codes for adapter operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -809: Configuration Errors
 * - -810 to -819: Process Errors
 * - -820 to -829: Handshake Errors
 * - -830 to -849: Protocol Errors
 * - -850 to -869: Transfer Errors
 * - -890 to -899: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Configuration Errors (-800 to -809)
    config_invalid = -800,
    adapter_conflict = -801,
    adapter_not_found = -802,
    invalid_direction = -803,
    invalid_boolean = -804,

    // Process Errors (-810 to -819)
    process_spawn_failed = -810,
    pipe_setup_failed = -811,
    process_exit_failure = -812,
    process_not_running = -813,

    // Handshake Errors (-820 to -829)
    init_rejected = -820,
    init_failed = -821,

    // Protocol Errors (-830 to -849)
    protocol_io_error = -830,
    protocol_unparseable = -831,
    protocol_unexpected_response = -832,
    protocol_oid_mismatch = -833,
    protocol_timeout = -834,
    protocol_line_too_long = -835,
    protocol_encode_failed = -836,

    // Transfer Errors (-850 to -869)
    transfer_failed = -850,
    action_missing = -851,
    local_object_missing = -852,
    verification_failed = -853,
    download_path_missing = -854,
    download_hash_mismatch = -855,
    download_store_failed = -856,
    transfer_cancelled = -857,
    worker_unavailable = -858,
    invalid_context = -859,

    // Internal Errors (-890 to -899)
    internal_error = -890,
    not_initialized = -891,
    already_initialized = -892,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        // Configuration Errors
        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::adapter_conflict:
            return "adapter already registered";
        case error_code::adapter_not_found:
            return "adapter not registered";
        case error_code::invalid_direction:
            return "invalid transfer direction";
        case error_code::invalid_boolean:
            return "invalid boolean value";

        // Process Errors
        case error_code::process_spawn_failed:
            return "failed to start transfer process";
        case error_code::pipe_setup_failed:
            return "failed to set up process pipes";
        case error_code::process_exit_failure:
            return "transfer process exited abnormally";
        case error_code::process_not_running:
            return "transfer process not running";

        // Handshake Errors
        case error_code::init_rejected:
            return "transfer process rejected init";
        case error_code::init_failed:
            return "init handshake failed";

        // Protocol Errors
        case error_code::protocol_io_error:
            return "pipe I/O error";
        case error_code::protocol_unparseable:
            return "unparseable protocol line";
        case error_code::protocol_unexpected_response:
            return "unexpected protocol response";
        case error_code::protocol_oid_mismatch:
            return "response oid mismatch";
        case error_code::protocol_timeout:
            return "timed out waiting for transfer process";
        case error_code::protocol_line_too_long:
            return "protocol line exceeds maximum length";
        case error_code::protocol_encode_failed:
            return "failed to encode protocol message";

        // Transfer Errors
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::action_missing:
            return "object not found on the server";
        case error_code::local_object_missing:
            return "local object not found";
        case error_code::verification_failed:
            return "upload verification failed";
        case error_code::download_path_missing:
            return "download completed without a path";
        case error_code::download_hash_mismatch:
            return "downloaded content does not match oid";
        case error_code::download_store_failed:
            return "failed to store downloaded object";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::worker_unavailable:
            return "no transfer worker available";
        case error_code::invalid_context:
            return "invalid worker context";

        // Internal Errors
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";

        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_configuration_error(error_code code) noexcept
    -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -800 && v >= -809;
}

/**
 * @brief Check if error code is in process error range
 */
[[nodiscard]] constexpr auto is_process_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -810 && v >= -819;
}

/**
 * @brief Check if error code is in handshake error range
 */
[[nodiscard]] constexpr auto is_handshake_error(error_code code) noexcept
    -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -820 && v >= -829;
}

/**
 * @brief Check if error code is in protocol error range
 */
[[nodiscard]] constexpr auto is_protocol_error(error_code code) noexcept
    -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -830 && v >= -849;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept
    -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -850 && v >= -869;
}

/**
 * @brief Check if an error leaves the worker process unusable
 *
 * Process, handshake and protocol failures mean the conversation with the
 * external process can no longer be trusted.
 */
[[nodiscard]] constexpr auto is_worker_fatal(error_code code) noexcept -> bool {
    return is_process_error(code) || is_handshake_error(code) ||
           is_protocol_error(code);
}

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_CORE_ERROR_CODES_H
