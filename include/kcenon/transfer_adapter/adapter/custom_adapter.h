/**
 * @file custom_adapter.h
 * @brief Transfer adapter that delegates to an external program
 */

#ifndef KCENON_TRANSFER_ADAPTER_ADAPTER_CUSTOM_ADAPTER_H
#define KCENON_TRANSFER_ADAPTER_ADAPTER_CUSTOM_ADAPTER_H

#include <filesystem>
#include <memory>

#include "kcenon/transfer_adapter/adapter/adapter_base.h"
#include "kcenon/transfer_adapter/adapter/adapter_definition.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Host collaborators used by custom adapters
 *
 * Every member is optional.
 */
struct adapter_services {
    /// Confirms a successful upload with the server
    object_verifier verify_upload;

    /// Maps an oid to its local object file; transfer::path is used without it
    object_path_resolver resolve_object_path;

    /// Moves downloaded content into the local object store
    download_store store_download;

    /// Check that downloaded content hashes to its SHA-256 oid
    bool verify_download_content = false;
};

/**
 * @brief Runs one external transfer process per worker
 *
 * Each worker launches the definition's program, performs the init
 * handshake, then exchanges one request and its progress/completion
 * responses per transfer. A protocol violation aborts the worker's process;
 * an error reported by the process for one object fails only that object.
 *
 * @code
 * adapter_definition def;
 * def.name = "testagent";
 * def.path = "/usr/local/bin/lfs-agent";
 *
 * custom_adapter adapter(def, transfer_direction::upload, services);
 * adapter.begin(4, on_progress, on_complete);
 * @endcode
 */
class custom_adapter : public adapter_base {
public:
    custom_adapter(std::shared_ptr<const adapter_definition> definition,
                   transfer_direction direction,
                   adapter_services services = {});
    custom_adapter(const adapter_definition& definition,
                   transfer_direction direction,
                   adapter_services services = {});
    ~custom_adapter() override;

    [[nodiscard]] auto definition() const -> const adapter_definition& { return *definition_; }

    [[nodiscard]] auto worker_starting(int worker_id)
        -> result<std::unique_ptr<worker_context>> override;

    void worker_ending(int worker_id, std::unique_ptr<worker_context> context) override;

    [[nodiscard]] auto do_transfer(worker_context& context,
                                   const transfer& t,
                                   const progress_callback& progress,
                                   const auth_callback& auth_ok)
        -> result<std::filesystem::path> override;

protected:
    [[nodiscard]] auto effective_concurrency(int requested) const -> int override;

private:
    [[nodiscard]] auto upload_source(const transfer& t) const -> result<std::filesystem::path>;
    [[nodiscard]] auto finish_upload(const transfer& t) -> result<std::filesystem::path>;
    [[nodiscard]] auto finish_download(const transfer& t,
                                       const std::optional<std::string>& reported_path)
        -> result<std::filesystem::path>;

    std::shared_ptr<const adapter_definition> definition_;
    adapter_services services_;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_ADAPTER_CUSTOM_ADAPTER_H
