/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for transfer_adapter_system
 * @version 0.1.0
 *
 * Objects, resource actions, transfer units and the callbacks a host hands
 * to an adapter.
 */

#ifndef KCENON_TRANSFER_ADAPTER_CORE_TRANSFER_TYPES_H
#define KCENON_TRANSFER_ADAPTER_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/transfer_adapter/core/types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Direction an adapter instance transfers in
 */
enum class transfer_direction {
    upload,
    download,
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) noexcept
    -> std::string_view {
    switch (dir) {
        case transfer_direction::upload:
            return "upload";
        case transfer_direction::download:
            return "download";
        default:
            return "unknown";
    }
}

/**
 * @brief Directions an adapter definition is registered for
 *
 * `both` expands into independent upload and download registrations.
 */
enum class adapter_direction {
    upload,
    download,
    both,
};

[[nodiscard]] constexpr auto to_string(adapter_direction dir) noexcept
    -> std::string_view {
    switch (dir) {
        case adapter_direction::upload:
            return "upload";
        case adapter_direction::download:
            return "download";
        case adapter_direction::both:
            return "both";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a configured direction, case-insensitively
 *
 * An empty value means `both`.
 */
[[nodiscard]] auto parse_adapter_direction(std::string_view value)
    -> result<adapter_direction>;

[[nodiscard]] constexpr auto includes(adapter_direction set,
                                      transfer_direction dir) noexcept -> bool {
    if (set == adapter_direction::both) return true;
    return (set == adapter_direction::upload) == (dir == transfer_direction::upload);
}

/**
 * @brief Error reported by the server or the transfer process for one object
 */
struct object_error {
    int32_t code = 0;
    std::string message;
};

/**
 * @brief Pre-resolved resource action (link) for one object
 *
 * Carries the location and any credentials the external process needs to
 * perform the network operation.
 */
struct action {
    std::string href;
    std::map<std::string, std::string> header;
    std::optional<std::string> expires_at;
};

/**
 * @brief Object to transfer, as described by the server
 */
struct transfer_object {
    std::string oid;
    int64_t size = 0;
    std::map<std::string, action> actions;

    /**
     * @brief Look up a resolved action ("upload", "download", "verify")
     * @return Pointer to the action, or nullptr if the server sent none
     */
    [[nodiscard]] auto rel(std::string_view name) const -> const action* {
        auto it = actions.find(std::string(name));
        return it == actions.end() ? nullptr : &it->second;
    }
};

/**
 * @brief One unit of work handed to an adapter
 */
struct transfer {
    /// Display name (usually the working tree path), passed to progress
    std::string name;
    transfer_object object;
    /// Local object path for uploads when no path resolver is configured
    std::filesystem::path path;
};

/**
 * @brief Outcome of one transfer
 */
struct transfer_result {
    std::string name;
    std::string oid;
    /// Set on failure
    std::optional<error> err;
    /// Location of downloaded content as reported by the transfer process
    std::optional<std::filesystem::path> path;

    [[nodiscard]] auto succeeded() const -> bool { return !err.has_value(); }
};

/**
 * @brief Progress callback: (name, total size, bytes so far, bytes since last)
 */
using progress_callback =
    std::function<void(const std::string&, int64_t, int64_t, int64_t)>;

/**
 * @brief Invoked once per finished transfer
 */
using completion_callback = std::function<void(const transfer_result&)>;

/**
 * @brief Invoked the first time a transfer shows the remote accepted credentials
 */
using auth_callback = std::function<void()>;

/**
 * @brief Verifies an uploaded object with the server
 */
using object_verifier = std::function<result<void>(const transfer_object&)>;

/**
 * @brief Resolves an oid to its path in the local object store
 */
using object_path_resolver =
    std::function<std::filesystem::path(const std::string&)>;

/**
 * @brief Receives a downloaded file to move it into the local object store
 */
using download_store =
    std::function<result<void>(const transfer_object&, const std::filesystem::path&)>;

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_CORE_TRANSFER_TYPES_H
