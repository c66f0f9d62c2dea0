/**
 * @file adapter_base.h
 * @brief Worker pool shared by transfer adapters
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_BASE_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_BASE_H

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "kcenon/transfer_adapter/adapter/transfer_adapter.h"

namespace kcenon::transfer_adapter {

/// Concurrency assumed before begin() names one
inline constexpr int default_concurrent_transfers = 3;

/**
 * @brief Drives a pool of workers over a queue of transfers
 *
 * Each worker thread calls worker_starting() once, then runs queued
 * transfers through do_transfer() until the queue is closed, then calls
 * worker_ending(). Only worker 0 starts transferring right away; the others
 * wait until it reports authentication success or finishes its first
 * transfer, so a credential prompt is shown at most once.
 *
 * A worker whose context is no longer usable after a transfer is ended and
 * started again. A worker that cannot start leaves the pool; once no worker
 * remains, queued and later transfers fail with worker_unavailable.
 *
 * Progress and completion callbacks are serialized.
 */
class adapter_base : public transfer_adapter {
public:
    adapter_base(std::string name, transfer_direction direction);
    ~adapter_base() override;

    adapter_base(const adapter_base&) = delete;
    auto operator=(const adapter_base&) -> adapter_base& = delete;

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto direction() const -> transfer_direction override { return direction_; }

    [[nodiscard]] auto begin(int max_concurrency,
                             progress_callback progress,
                             completion_callback completion) -> result<void> override;
    [[nodiscard]] auto add(transfer t) -> result<void> override;
    void end() override;
    void cancel() override;

    /**
     * @brief Number of workers started by the last begin()
     */
    [[nodiscard]] auto worker_count() const -> int;

    /**
     * @brief Create the context for one worker
     */
    [[nodiscard]] virtual auto worker_starting(int worker_id)
        -> result<std::unique_ptr<worker_context>> = 0;

    /**
     * @brief Release a worker's context
     */
    virtual void worker_ending(int worker_id, std::unique_ptr<worker_context> context) = 0;

    /**
     * @brief Run one transfer on a worker's context
     * @param auth_ok Call once the remote side has accepted the credentials
     * @return Location of the received content for downloads, empty for uploads
     */
    [[nodiscard]] virtual auto do_transfer(worker_context& context,
                                           const transfer& t,
                                           const progress_callback& progress,
                                           const auth_callback& auth_ok)
        -> result<std::filesystem::path> = 0;

protected:
    /**
     * @brief Number of workers to run for a requested concurrency
     */
    [[nodiscard]] virtual auto effective_concurrency(int requested) const -> int {
        return requested;
    }

    /**
     * @brief Concurrency passed to the last begin()
     */
    [[nodiscard]] auto requested_concurrency() const -> int;

private:
    void run_worker(int worker_id);
    [[nodiscard]] auto next_transfer(bool wait_for_auth) -> std::optional<transfer>;
    void signal_auth();
    void worker_lost(int worker_id, const error& err);
    void track(worker_context* context);
    void untrack(worker_context* context);

    void report(const transfer& t, result<std::filesystem::path> outcome);
    void report_failure(const transfer& t, const error& err);

    std::string name_;
    transfer_direction direction_;

    progress_callback progress_;
    completion_callback completion_;
    std::mutex callback_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<transfer> queue_;
    std::vector<std::thread> workers_;
    std::vector<worker_context*> live_contexts_;
    int requested_concurrency_ = default_concurrent_transfers;
    int worker_count_ = 0;
    int live_workers_ = 0;
    bool running_ = false;
    bool closed_ = false;
    bool cancelled_ = false;
    bool auth_signaled_ = false;
    std::optional<error> last_start_error_;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_ADAPTER_BASE_H
