/**
 * @file transfer_adapter.h
 * @brief Main header for transfer_adapter_system library
 * @version 0.1.0
 *
 * Include this header to configure custom transfer adapters and run
 * transfers through external programs.
 *
 * @code
 * #include <kcenon/transfer_adapter/transfer_adapter.h>
 *
 * using namespace kcenon::transfer_adapter;
 *
 * adapter_registry registry;
 * auto report = configure_custom_adapters(config, registry);
 *
 * auto adapter = registry.create("testagent", transfer_direction::upload);
 * adapter.value()->begin(4, on_progress, on_complete);
 * @endcode
 */

#ifndef KCENON_TRANSFER_ADAPTER_TRANSFER_ADAPTER_H
#define KCENON_TRANSFER_ADAPTER_TRANSFER_ADAPTER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/transfer_adapter/core/types.h"
#include "kcenon/transfer_adapter/core/transfer_types.h"

// Configuration
#include "kcenon/transfer_adapter/config/config_source.h"

// Adapters
#include "kcenon/transfer_adapter/adapter/adapter_registry.h"
#include "kcenon/transfer_adapter/adapter/custom_adapter.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static auto to_string() -> std::string {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_TRANSFER_ADAPTER_H
