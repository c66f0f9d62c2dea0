/**
 * @file worker_process_context.h
 * @brief One running transfer process and its protocol session
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_WORKER_PROCESS_CONTEXT_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_WORKER_PROCESS_CONTEXT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "kcenon/transfer_adapter/adapter/adapter_definition.h"
#include "kcenon/transfer_adapter/adapter/transfer_adapter.h"
#include "kcenon/transfer_adapter/core/types.h"
#include "kcenon/transfer_adapter/process/child_process.h"
#include "kcenon/transfer_adapter/process/pipe_stream.h"
#include "kcenon/transfer_adapter/protocol/line_codec.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Protocol session with one external transfer process
 *
 * Session states:
 * - started: process running, init not yet acknowledged
 * - ready: init acknowledged, transfers may run
 * - closed: terminated, aborted or broken by an I/O or protocol error
 *
 * Destroying a session that is not closed aborts it, so a process is never
 * left running past the session that owns it.
 */
class worker_process_context : public worker_context {
public:
    enum class session_state { started, ready, closed };

    /**
     * @brief Launch the definition's program for one worker
     */
    [[nodiscard]] static auto start(const adapter_definition& definition, int worker_id)
        -> result<std::unique_ptr<worker_process_context>>;

    worker_process_context(const worker_process_context&) = delete;
    auto operator=(const worker_process_context&) -> worker_process_context& = delete;

    ~worker_process_context() override;

    /**
     * @brief Write one message as a line
     *
     * A failed write closes the session.
     */
    template <typename Message>
    [[nodiscard]] auto send(const Message& message) -> result<void> {
        auto line = encode_line(message);
        if (!line) {
            return unexpected{line.error()};
        }
        return send_line(line.value());
    }

    /**
     * @brief Read one line and decode it as one of the candidates
     *
     * A failed read or an undecodable line closes the session.
     */
    template <typename... Candidates>
    [[nodiscard]] auto receive() -> result<std::variant<Candidates...>> {
        auto line = read_line();
        if (!line) {
            return unexpected{line.error()};
        }
        auto decoded = decode_line<Candidates...>(line.value());
        if (!decoded) {
            mark_broken(decoded.error());
            return unexpected{decoded.error()};
        }
        return std::move(decoded.value());
    }

    /**
     * @brief Send a request and read exactly one response of the given type
     */
    template <typename Request, typename Response>
    [[nodiscard]] auto exchange(const Request& request, Response& response) -> result<void> {
        auto sent = send(request);
        if (!sent) {
            return sent;
        }
        auto received = receive<Response>();
        if (!received) {
            return unexpected{received.error()};
        }
        response = std::get<Response>(std::move(received.value()));
        return {};
    }

    /**
     * @brief Mark the init handshake as acknowledged
     */
    void mark_ready();

    /**
     * @brief Ask the process to terminate and wait for it
     *
     * Sends terminate, closes both pipes and reaps the process. A nonzero
     * exit status is reported as process_exit_failure.
     */
    [[nodiscard]] auto shutdown() -> result<void>;

    /**
     * @brief Close pipes, kill and reap the process; idempotent
     */
    void abort() noexcept;

    /**
     * @brief Kill the process without touching the pipes
     *
     * The owning worker then sees its pending read or write fail.
     */
    void interrupt() noexcept override;

    [[nodiscard]] auto usable() const -> bool override;
    [[nodiscard]] auto state() const -> session_state { return state_.load(); }

    [[nodiscard]] auto adapter_name() const -> const std::string& { return adapter_name_; }
    [[nodiscard]] auto worker_id() const noexcept -> int { return worker_id_; }
    [[nodiscard]] auto pid() const noexcept -> pid_t { return process_->pid(); }

private:
    worker_process_context(const adapter_definition& definition,
                           int worker_id,
                           std::unique_ptr<child_process> process);

    [[nodiscard]] auto send_line(const std::string& line) -> result<void>;
    [[nodiscard]] auto read_line() -> result<std::string>;
    void mark_broken(const error& err);

    std::string adapter_name_;
    int worker_id_;
    std::chrono::milliseconds read_timeout_;

    std::unique_ptr<child_process> process_;
    pipe_writer input_;
    pipe_line_reader output_;

    std::atomic<session_state> state_{session_state::started};
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_WORKER_PROCESS_CONTEXT_H
