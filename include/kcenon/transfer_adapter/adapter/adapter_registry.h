/**
 * @file adapter_registry.h
 * @brief Registry of custom transfer adapter definitions
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_REGISTRY_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kcenon/transfer_adapter/adapter/adapter_definition.h"
#include "kcenon/transfer_adapter/adapter/custom_adapter.h"
#include "kcenon/transfer_adapter/adapter/transfer_adapter.h"
#include "kcenon/transfer_adapter/config/config_source.h"
#include "kcenon/transfer_adapter/core/types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Maps (name, direction) to an adapter definition
 *
 * Definitions are immutable once registered. Every adapter is built by the
 * same constructor from its definition and the host's services.
 *
 * @note Thread-safe.
 */
class adapter_registry {
public:
    /**
     * @brief Register a definition for one direction
     * @return adapter_conflict if (name, direction) is already registered;
     *         the existing registration is kept
     */
    [[nodiscard]] auto register_adapter(transfer_direction direction,
                                        adapter_definition definition) -> result<void>;

    [[nodiscard]] auto find(std::string_view name, transfer_direction direction) const
        -> std::shared_ptr<const adapter_definition>;

    [[nodiscard]] auto contains(std::string_view name, transfer_direction direction) const
        -> bool;

    /**
     * @brief Registered names for a direction, sorted
     */
    [[nodiscard]] auto names(transfer_direction direction) const -> std::vector<std::string>;

    /**
     * @brief Build an adapter instance
     * @return adapter_not_found if (name, direction) is not registered
     */
    [[nodiscard]] auto create(std::string_view name,
                              transfer_direction direction,
                              adapter_services services = {}) const
        -> result<std::unique_ptr<transfer_adapter>>;

private:
    using key_type = std::pair<std::string, transfer_direction>;

    mutable std::mutex mutex_;
    std::map<key_type, std::shared_ptr<const adapter_definition>> definitions_;
};

/**
 * @brief Outcome of scanning configuration for custom adapters
 */
struct configure_report {
    /// Adapter names registered for at least one direction
    std::vector<std::string> registered;

    /// Problems found; each skipped the adapter or direction it names
    std::vector<error> errors;

    [[nodiscard]] auto ok() const -> bool { return errors.empty(); }
};

/**
 * @brief Register every custom adapter described in configuration
 *
 * Scans for `<ns>.customtransfer.<name>.path` and reads the sibling keys
 * `args`, `concurrent`, `direction` and `readtimeout` (seconds). An entry
 * with an invalid value is skipped and reported; the scan continues.
 *
 * @code
 * memory_config_source config({
 *     {"lfs.customtransfer.testagent.path", "/usr/local/bin/lfs-agent"},
 *     {"lfs.customtransfer.testagent.concurrent", "false"},
 * });
 * adapter_registry registry;
 * auto report = configure_custom_adapters(config, registry);
 * @endcode
 */
[[nodiscard]] auto configure_custom_adapters(const config_source& source,
                                             adapter_registry& registry,
                                             std::string_view ns = "lfs")
    -> configure_report;

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_REGISTRY_H
