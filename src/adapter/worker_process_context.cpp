/**
 * @file worker_process_context.cpp
 * @brief Implementation of the transfer process session
 */

#include <kcenon/transfer_adapter/adapter/worker_process_context.h>

#include <kcenon/transfer_adapter/core/logging.h>

namespace kcenon::transfer_adapter {

namespace {

auto worker_log_context(const std::string& adapter, int worker_id, pid_t pid)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.adapter = adapter;
    ctx.worker_id = worker_id;
    ctx.pid = static_cast<int64_t>(pid);
    return ctx;
}

auto trim_newline(const std::string& line) -> std::string_view {
    std::string_view view(line);
    if (!view.empty() && view.back() == '\n') {
        view.remove_suffix(1);
    }
    return view;
}

}  // namespace

worker_process_context::worker_process_context(const adapter_definition& definition,
                                               int worker_id,
                                               std::unique_ptr<child_process> process)
    : adapter_name_(definition.name),
      worker_id_(worker_id),
      read_timeout_(definition.read_timeout),
      process_(std::move(process)),
      input_(process_->take_stdin()),
      output_(process_->take_stdout(), max_line_length) {}

auto worker_process_context::start(const adapter_definition& definition, int worker_id)
    -> result<std::unique_ptr<worker_process_context>> {
    auto process = child_process::spawn(definition.path, split_arguments(definition.args));
    if (!process) {
        TA_LOG_ERROR(log_category::worker, process.error().message);
        return unexpected{process.error()};
    }

    std::unique_ptr<worker_process_context> context(
        new worker_process_context(definition, worker_id, std::move(process.value())));

    auto log_ctx = worker_log_context(context->adapter_name_, worker_id, context->pid());
    TA_LOG_DEBUG_CTX(log_category::worker,
                     "started custom transfer command \"" + definition.path + "\"", log_ctx);
    return context;
}

worker_process_context::~worker_process_context() {
    abort();
}

void worker_process_context::mark_ready() {
    auto expected = session_state::started;
    state_.compare_exchange_strong(expected, session_state::ready);
}

auto worker_process_context::usable() const -> bool {
    return state_.load() == session_state::ready;
}

auto worker_process_context::send_line(const std::string& line) -> result<void> {
    if (state_.load() == session_state::closed) {
        return unexpected{error{error_code::process_not_running,
                                "custom transfer \"" + adapter_name_ + "\" worker " +
                                    std::to_string(worker_id_) + " is closed"}};
    }

    if (get_logger().is_enabled(log_level::trace)) {
        auto log_ctx = worker_log_context(adapter_name_, worker_id_, pid());
        TA_LOG_TRACE_CTX(log_category::protocol,
                         "-> " + std::string(trim_newline(line)), log_ctx);
    }

    auto written = input_.write_all(line);
    if (!written) {
        mark_broken(written.error());
        return written;
    }
    return {};
}

auto worker_process_context::read_line() -> result<std::string> {
    if (state_.load() == session_state::closed) {
        return unexpected{error{error_code::process_not_running,
                                "custom transfer \"" + adapter_name_ + "\" worker " +
                                    std::to_string(worker_id_) + " is closed"}};
    }

    auto line = output_.read_line(read_timeout_);
    if (!line) {
        mark_broken(line.error());
        return line;
    }

    if (get_logger().is_enabled(log_level::trace)) {
        auto log_ctx = worker_log_context(adapter_name_, worker_id_, pid());
        TA_LOG_TRACE_CTX(log_category::protocol, "<- " + line.value(), log_ctx);
    }
    return line;
}

void worker_process_context::mark_broken(const error& err) {
    auto log_ctx = worker_log_context(adapter_name_, worker_id_, pid());
    log_ctx.error_message = err.message;
    TA_LOG_WARN_CTX(log_category::worker, "transfer process session failed", log_ctx);
    abort();
}

auto worker_process_context::shutdown() -> result<void> {
    if (state_.load() == session_state::closed) {
        return {};
    }

    auto log_ctx = worker_log_context(adapter_name_, worker_id_, pid());
    TA_LOG_DEBUG_CTX(log_category::worker, "shutting down custom transfer process", log_ctx);

    result<void> outcome;
    auto terminate = encode_line(terminate_request{});
    if (terminate) {
        outcome = input_.write_all(terminate.value());
    } else {
        outcome = unexpected{terminate.error()};
    }

    state_.store(session_state::closed);

    auto closed_input = input_.close();
    if (outcome && !closed_input) {
        outcome = closed_input;
    }

    if (!outcome) {
        // The process may never see terminate; do not wait on it forever
        process_->kill();
    }

    // Nothing is read after terminate; a process still writing gets EPIPE
    // instead of blocking the wait below
    (void)output_.close();
    auto exited = process_->wait();

    if (!outcome) {
        return outcome;
    }
    if (!exited) {
        log_ctx.error_message = exited.error().message;
        TA_LOG_WARN_CTX(log_category::worker, "custom transfer process exited abnormally",
                        log_ctx);
        return exited;
    }
    return {};
}

void worker_process_context::abort() noexcept {
    state_.store(session_state::closed);
    (void)input_.close();
    (void)output_.close();
    if (!process_->reaped()) {
        process_->kill();
        // Killed on purpose; the exit status carries no information
        (void)process_->wait();
    }
}

void worker_process_context::interrupt() noexcept {
    process_->kill();
}

}  // namespace kcenon::transfer_adapter
