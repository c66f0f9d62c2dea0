/**
 * @file transfer_adapter.h
 * @brief Transfer adapter interface
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_TRANSFER_ADAPTER_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_TRANSFER_ADAPTER_H

#include <string>

#include "kcenon/transfer_adapter/core/transfer_types.h"
#include "kcenon/transfer_adapter/core/types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Per-worker state owned by exactly one worker for its lifetime
 */
class worker_context {
public:
    virtual ~worker_context() = default;

    /**
     * @brief Whether further transfers may run on this context
     */
    [[nodiscard]] virtual auto usable() const -> bool = 0;

    /**
     * @brief Make any blocked operation on this context fail promptly
     *
     * Safe to call from a thread other than the owning worker.
     */
    virtual void interrupt() noexcept = 0;
};

/**
 * @brief Transfers objects in one direction
 *
 * @code
 * auto adapter = registry.create("testagent", transfer_direction::upload, services);
 * adapter.value()->begin(4, on_progress, on_complete);
 * adapter.value()->add(t);
 * adapter.value()->end();
 * @endcode
 */
class transfer_adapter {
public:
    virtual ~transfer_adapter() = default;

    [[nodiscard]] virtual auto name() const -> const std::string& = 0;
    [[nodiscard]] virtual auto direction() const -> transfer_direction = 0;

    /**
     * @brief Start workers for a batch
     * @param max_concurrency Requested number of workers
     * @param progress Called for every progress report
     * @param completion Called once per finished transfer
     */
    [[nodiscard]] virtual auto begin(int max_concurrency,
                                     progress_callback progress,
                                     completion_callback completion) -> result<void> = 0;

    /**
     * @brief Queue one transfer; its outcome arrives via the completion callback
     */
    [[nodiscard]] virtual auto add(transfer t) -> result<void> = 0;

    /**
     * @brief Finish queued transfers, stop all workers and wait for them
     */
    virtual void end() = 0;

    /**
     * @brief Fail queued transfers and interrupt running ones
     */
    virtual void cancel() = 0;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_TRANSFER_ADAPTER_H
