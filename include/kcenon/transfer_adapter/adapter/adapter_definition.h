/**
 * @file adapter_definition.h
 * @brief Declarative description of one custom transfer adapter
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_DEFINITION_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_DEFINITION_H

#include <chrono>
#include <string>

#include "kcenon/transfer_adapter/core/transfer_types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief One configured external transfer program
 *
 * Built once from configuration and shared read-only by every worker of
 * every adapter instance created from it.
 */
struct adapter_definition {
    /// Adapter name, unique per direction
    std::string name;

    /// Executable to launch for each worker
    std::string path;

    /// Argument string, split into words at launch
    std::string args;

    /// false limits the adapter to a single process
    bool concurrent = true;

    /// Directions the adapter is registered for
    adapter_direction direction = adapter_direction::both;

    /// Longest wait for one line from the process; zero waits forever
    std::chrono::milliseconds read_timeout{0};
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_DEFINITION_H
