/**
 * @file custom_adapter.cpp
 * @brief Implementation of the external program transfer adapter
 */

#include <kcenon/transfer_adapter/adapter/custom_adapter.h>

#include <chrono>
#include <system_error>

#include <kcenon/transfer_adapter/adapter/worker_process_context.h>
#include <kcenon/transfer_adapter/core/checksum.h>
#include <kcenon/transfer_adapter/core/logging.h>

namespace kcenon::transfer_adapter {

namespace {

enum class exchange_state { idle, requested, in_progress, completed };

auto oid_mismatch(const std::string& got, const std::string& expected) -> error {
    return error{error_code::protocol_oid_mismatch,
                 "Unexpected oid \"" + got + "\" in response, expecting \"" + expected + "\""};
}

}  // namespace

custom_adapter::custom_adapter(std::shared_ptr<const adapter_definition> definition,
                               transfer_direction direction,
                               adapter_services services)
    : adapter_base(definition->name, direction),
      definition_(std::move(definition)),
      services_(std::move(services)) {}

custom_adapter::custom_adapter(const adapter_definition& definition,
                               transfer_direction direction,
                               adapter_services services)
    : custom_adapter(std::make_shared<const adapter_definition>(definition),
                     direction,
                     std::move(services)) {}

custom_adapter::~custom_adapter() {
    // Workers call back into this object; stop them while it is intact
    end();
}

auto custom_adapter::effective_concurrency(int requested) const -> int {
    int count = definition_->concurrent ? requested : 1;

    transfer_log_context log_ctx;
    log_ctx.adapter = definition_->name;
    TA_LOG_DEBUG_CTX(log_category::adapter,
                     "using concurrency " + std::to_string(count), log_ctx);
    return count;
}

auto custom_adapter::worker_starting(int worker_id) -> result<std::unique_ptr<worker_context>> {
    transfer_log_context log_ctx;
    log_ctx.adapter = definition_->name;
    log_ctx.worker_id = worker_id;
    TA_LOG_DEBUG_CTX(log_category::worker, "starting up custom transfer process", log_ctx);

    auto started = worker_process_context::start(*definition_, worker_id);
    if (!started) {
        return unexpected{started.error()};
    }
    auto context = std::move(started.value());

    init_request request;
    request.operation = std::string(to_string(direction()));
    request.concurrent = definition_->concurrent;
    request.concurrent_transfers = requested_concurrency();

    init_response response;
    auto exchanged = context->exchange(request, response);
    if (!exchanged) {
        context->abort();
        return unexpected{error{error_code::init_failed,
                                "custom transfer \"" + definition_->name + "\" worker " +
                                    std::to_string(worker_id) +
                                    " failed to initialize: " + exchanged.error().message}};
    }
    if (response.error) {
        context->abort();
        log_ctx.error_message = response.error->message;
        TA_LOG_ERROR_CTX(log_category::worker, "custom transfer process rejected init",
                         log_ctx);
        return unexpected{error{error_code::init_rejected,
                                "custom transfer \"" + definition_->name + "\" worker " +
                                    std::to_string(worker_id) +
                                    " rejected init: " + response.error->message}};
    }

    context->mark_ready();
    log_ctx.pid = static_cast<int64_t>(context->pid());
    TA_LOG_DEBUG_CTX(log_category::worker, "custom transfer process started OK", log_ctx);
    return std::unique_ptr<worker_context>(std::move(context));
}

void custom_adapter::worker_ending(int worker_id, std::unique_ptr<worker_context> context) {
    auto* process = dynamic_cast<worker_process_context*>(context.get());
    if (process == nullptr) {
        TA_LOG_WARN(log_category::worker,
                    "Context object for custom transfer \"" + definition_->name +
                        "\" was of the wrong type");
        return;
    }

    auto finished = process->shutdown();
    if (!finished) {
        transfer_log_context log_ctx;
        log_ctx.adapter = definition_->name;
        log_ctx.worker_id = worker_id;
        log_ctx.error_message = finished.error().message;
        TA_LOG_WARN_CTX(log_category::worker,
                        "error finishing up custom transfer process, aborting", log_ctx);
        process->abort();
    }
}

auto custom_adapter::upload_source(const transfer& t) const -> result<std::filesystem::path> {
    std::filesystem::path source =
        services_.resolve_object_path ? services_.resolve_object_path(t.object.oid) : t.path;
    if (source.empty()) {
        return unexpected{error{error_code::local_object_missing,
                                "no local object path for " + t.object.oid}};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return unexpected{error{error_code::local_object_missing,
                                "local object " + source.string() + " for " + t.object.oid +
                                    " does not exist"}};
    }
    return source;
}

auto custom_adapter::do_transfer(worker_context& context,
                                 const transfer& t,
                                 const progress_callback& progress,
                                 const auth_callback& auth_ok)
    -> result<std::filesystem::path> {
    auto* process = dynamic_cast<worker_process_context*>(&context);
    if (process == nullptr) {
        return unexpected{error{error_code::invalid_context,
                                "Context object for custom transfer \"" + definition_->name +
                                    "\" was of the wrong type"}};
    }
    if (!process->usable()) {
        return unexpected{error{error_code::invalid_context,
                                "Custom transfer \"" + definition_->name +
                                    "\" was not properly initialized, see previous errors"}};
    }

    const auto& object = t.object;
    const bool uploading = direction() == transfer_direction::upload;
    const action* link = object.rel(uploading ? "upload" : "download");
    if (link == nullptr) {
        return unexpected{error{error_code::action_missing, "Object not found on the server."}};
    }

    transfer_log_context log_ctx;
    log_ctx.adapter = definition_->name;
    log_ctx.oid = object.oid;
    log_ctx.worker_id = process->worker_id();
    log_ctx.size = object.size;
    const auto started_at = std::chrono::steady_clock::now();

    auto state = exchange_state::idle;
    result<void> sent;
    if (uploading) {
        auto source = upload_source(t);
        if (!source) {
            return unexpected{source.error()};
        }
        upload_request request;
        request.oid = object.oid;
        request.size = object.size;
        request.path = source.value().string();
        request.link = *link;
        sent = process->send(request);
    } else {
        download_request request;
        request.oid = object.oid;
        request.size = object.size;
        request.link = *link;
        sent = process->send(request);
    }
    if (!sent) {
        process->abort();
        return unexpected{sent.error()};
    }
    state = exchange_state::requested;
    TA_LOG_DEBUG_CTX(log_category::transfer, "transfer requested", log_ctx);

    bool auth_called = false;
    auto signal_auth = [&] {
        if (auth_ok && !auth_called) {
            auth_ok();
            auth_called = true;
        }
    };

    std::optional<std::string> reported_path;
    while (state != exchange_state::completed) {
        auto response = process->receive<progress_response, transfer_response>();
        if (!response) {
            process->abort();
            return unexpected{response.error()};
        }

        if (auto* update = std::get_if<progress_response>(&response.value())) {
            if (update->oid != object.oid) {
                process->abort();
                return unexpected{oid_mismatch(update->oid, object.oid)};
            }
            state = exchange_state::in_progress;
            if (progress) {
                progress(t.name, object.size, update->bytes_so_far, update->bytes_since_last);
            }
            // Some bytes moved, so the remote side accepted the credentials
            if (update->bytes_so_far > 0) {
                signal_auth();
            }
            continue;
        }

        auto& done = std::get<transfer_response>(response.value());
        if (done.oid != object.oid) {
            process->abort();
            return unexpected{oid_mismatch(done.oid, object.oid)};
        }
        if (done.error) {
            log_ctx.error_message = done.error->message;
            TA_LOG_WARN_CTX(log_category::transfer, "transfer process reported an error",
                            log_ctx);
            return unexpected{error{error_code::transfer_failed,
                                    "Error transferring \"" + object.oid + "\": " +
                                        done.error->message + " (code " +
                                        std::to_string(done.error->code) + ")"}};
        }
        signal_auth();
        reported_path = std::move(done.path);
        state = exchange_state::completed;
    }

    log_ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at)
            .count());
    TA_LOG_DEBUG_CTX(log_category::transfer, "transfer process reported completion", log_ctx);

    return uploading ? finish_upload(t) : finish_download(t, reported_path);
}

auto custom_adapter::finish_upload(const transfer& t) -> result<std::filesystem::path> {
    if (services_.verify_upload) {
        auto verified = services_.verify_upload(t.object);
        if (!verified) {
            return unexpected{error{error_code::verification_failed,
                                    "verification of " + t.object.oid +
                                        " failed: " + verified.error().message}};
        }
    }
    return std::filesystem::path{};
}

auto custom_adapter::finish_download(const transfer& t,
                                     const std::optional<std::string>& reported_path)
    -> result<std::filesystem::path> {
    if (!reported_path || reported_path->empty()) {
        return unexpected{error{error_code::download_path_missing,
                                "transfer process did not report where it stored " +
                                    t.object.oid}};
    }
    std::filesystem::path content(*reported_path);

    if (services_.verify_download_content && checksum::is_sha256_oid(t.object.oid)) {
        auto digest = checksum::sha256_file(content);
        if (!digest) {
            return unexpected{digest.error()};
        }
        if (digest.value() != t.object.oid) {
            return unexpected{error{error_code::download_hash_mismatch,
                                    "downloaded content at " + content.string() +
                                        " hashes to " + digest.value() + ", expected " +
                                        t.object.oid}};
        }
    }

    if (services_.store_download) {
        auto stored = services_.store_download(t.object, content);
        if (!stored) {
            return unexpected{error{error_code::download_store_failed,
                                    "cannot store " + t.object.oid + ": " +
                                        stored.error().message}};
        }
    }
    return content;
}

}  // namespace kcenon::transfer_adapter
