/**
 * @file adapter_base.cpp
 * @brief Implementation of the transfer worker pool
 */

#include <kcenon/transfer_adapter/adapter/adapter_base.h>

#include <algorithm>
#include <system_error>

#include <kcenon/transfer_adapter/core/logging.h>

namespace kcenon::transfer_adapter {

adapter_base::adapter_base(std::string name, transfer_direction direction)
    : name_(std::move(name)), direction_(direction) {}

adapter_base::~adapter_base() {
    // Derived classes end() in their own destructor; this only covers a
    // batch that never started a worker.
    end();
}

auto adapter_base::begin(int max_concurrency,
                         progress_callback progress,
                         completion_callback completion) -> result<void> {
    if (max_concurrency < 1) {
        return unexpected{error{error_code::config_invalid,
                                "concurrency must be at least 1, got " +
                                    std::to_string(max_concurrency)}};
    }

    int count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return unexpected{error{error_code::already_initialized,
                                    "adapter \"" + name_ + "\" has already begun"}};
        }
        count = std::clamp(effective_concurrency(max_concurrency), 1, max_concurrency);

        requested_concurrency_ = max_concurrency;
        worker_count_ = count;
        live_workers_ = count;
        running_ = true;
        closed_ = false;
        cancelled_ = false;
        auth_signaled_ = false;
        last_start_error_.reset();
        queue_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        progress_ = std::move(progress);
        completion_ = std::move(completion);
    }

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    TA_LOG_INFO_CTX(log_category::adapter,
                    "starting " + std::string(to_string(direction_)) + " with " +
                        std::to_string(count) + " worker(s)",
                    log_ctx);

    workers_.reserve(static_cast<std::size_t>(count));
    for (int id = 0; id < count; ++id) {
        try {
            workers_.emplace_back(&adapter_base::run_worker, this, id);
        } catch (const std::system_error& e) {
            worker_lost(id, error{error_code::internal_error,
                                  std::string("cannot create worker thread: ") + e.what()});
        }
    }
    return {};
}

auto adapter_base::add(transfer t) -> result<void> {
    std::optional<error> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || (closed_ && !cancelled_)) {
            return unexpected{error{error_code::not_initialized,
                                    "adapter \"" + name_ + "\" is not accepting transfers"}};
        }
        if (cancelled_) {
            rejected = error{error_code::transfer_cancelled, "transfer cancelled"};
        } else if (live_workers_ == 0) {
            rejected = error{error_code::worker_unavailable,
                             "no usable worker for \"" + name_ + "\"" +
                                 (last_start_error_ ? ": " + last_start_error_->message
                                                    : std::string())};
        } else {
            queue_.push_back(std::move(t));
        }
    }

    if (rejected) {
        report_failure(t, *rejected);
        return {};
    }
    cv_.notify_one();
    return {};
}

void adapter_base::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void adapter_base::cancel() {
    std::deque<transfer> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || cancelled_) {
            return;
        }
        cancelled_ = true;
        closed_ = true;
        dropped.swap(queue_);
        for (auto* context : live_contexts_) {
            context->interrupt();
        }
    }
    cv_.notify_all();

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    TA_LOG_INFO_CTX(log_category::adapter,
                    "cancelled with " + std::to_string(dropped.size()) + " queued transfer(s)",
                    log_ctx);

    for (const auto& t : dropped) {
        report_failure(t, error{error_code::transfer_cancelled, "transfer cancelled"});
    }
}

auto adapter_base::worker_count() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_count_;
}

auto adapter_base::requested_concurrency() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_concurrency_;
}

void adapter_base::run_worker(int worker_id) {
    auto started = worker_starting(worker_id);
    if (!started) {
        worker_lost(worker_id, started.error());
        return;
    }
    auto context = std::move(started.value());
    track(context.get());

    const progress_callback progress = [this](const std::string& name,
                                              int64_t size,
                                              int64_t bytes_so_far,
                                              int64_t bytes_since_last) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (progress_) {
            progress_(name, size, bytes_so_far, bytes_since_last);
        }
    };
    const auth_callback auth_ok = [this] { signal_auth(); };

    // Everyone but worker 0 holds back until authentication is settled
    bool gated = worker_id != 0;
    bool first = true;

    for (;;) {
        auto next = next_transfer(gated);
        gated = false;
        if (!next) {
            break;
        }

        auto outcome = do_transfer(*context, *next, progress, auth_ok);
        if (worker_id == 0 && first) {
            signal_auth();
        }
        first = false;
        report(*next, std::move(outcome));

        if (!context->usable()) {
            untrack(context.get());
            worker_ending(worker_id, std::move(context));

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (cancelled_) {
                    --live_workers_;
                    return;
                }
            }

            transfer_log_context log_ctx;
            log_ctx.adapter = name_;
            log_ctx.worker_id = worker_id;
            TA_LOG_DEBUG_CTX(log_category::worker, "restarting worker", log_ctx);

            auto restarted = worker_starting(worker_id);
            if (!restarted) {
                worker_lost(worker_id, restarted.error());
                return;
            }
            context = std::move(restarted.value());
            track(context.get());
        }
    }

    if (worker_id == 0) {
        signal_auth();
    }
    untrack(context.get());
    worker_ending(worker_id, std::move(context));

    std::lock_guard<std::mutex> lock(mutex_);
    --live_workers_;
}

auto adapter_base::next_transfer(bool wait_for_auth) -> std::optional<transfer> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait_for_auth) {
        cv_.wait(lock, [this] { return auth_signaled_ || cancelled_; });
    }
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    transfer t = std::move(queue_.front());
    queue_.pop_front();
    return t;
}

void adapter_base::signal_auth() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auth_signaled_) {
            return;
        }
        auth_signaled_ = true;
    }
    cv_.notify_all();

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    TA_LOG_DEBUG_CTX(log_category::worker, "authentication settled, releasing workers",
                     log_ctx);
}

void adapter_base::worker_lost(int worker_id, const error& err) {
    std::deque<transfer> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --live_workers_;
        last_start_error_ = err;
        if (worker_id == 0) {
            auth_signaled_ = true;
        }
        if (live_workers_ == 0) {
            orphaned.swap(queue_);
        }
    }
    cv_.notify_all();

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    log_ctx.worker_id = worker_id;
    log_ctx.error_message = err.message;
    TA_LOG_ERROR_CTX(log_category::worker, "worker could not start", log_ctx);

    for (const auto& t : orphaned) {
        report_failure(t, error{error_code::worker_unavailable,
                                "no usable worker for \"" + name_ + "\": " + err.message});
    }
}

void adapter_base::track(worker_context* context) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_contexts_.push_back(context);
    if (cancelled_) {
        context->interrupt();
    }
}

void adapter_base::untrack(worker_context* context) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_contexts_.erase(std::remove(live_contexts_.begin(), live_contexts_.end(), context),
                         live_contexts_.end());
}

void adapter_base::report(const transfer& t, result<std::filesystem::path> outcome) {
    if (!outcome) {
        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled = cancelled_;
        }
        if (cancelled) {
            report_failure(t, error{error_code::transfer_cancelled,
                                    "transfer cancelled: " + outcome.error().message});
        } else {
            report_failure(t, outcome.error());
        }
        return;
    }

    transfer_result done;
    done.name = t.name;
    done.oid = t.object.oid;
    if (!outcome.value().empty()) {
        done.path = outcome.value();
    }

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    log_ctx.oid = t.object.oid;
    log_ctx.size = t.object.size;
    TA_LOG_DEBUG_CTX(log_category::transfer, "transfer complete", log_ctx);

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (completion_) {
        completion_(done);
    }
}

void adapter_base::report_failure(const transfer& t, const error& err) {
    transfer_result failed;
    failed.name = t.name;
    failed.oid = t.object.oid;
    failed.err = err;

    transfer_log_context log_ctx;
    log_ctx.adapter = name_;
    log_ctx.oid = t.object.oid;
    log_ctx.error_message = err.message;
    TA_LOG_WARN_CTX(log_category::transfer, "transfer failed", log_ctx);

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (completion_) {
        completion_(failed);
    }
}

}  // namespace kcenon::transfer_adapter
