/**
 * @file checksum.h
 * @brief SHA-256 utilities for object content verification
 */

#ifndef KCENON_TRANSFER_ADAPTER_CORE_CHECKSUM_H
#define KCENON_TRANSFER_ADAPTER_CORE_CHECKSUM_H

#include <kcenon/transfer_adapter/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::transfer_adapter {

/**
 * @brief Incremental SHA-256 hasher
 *
 * Content is fed in pieces so large objects never need to be held in memory.
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(first_block);
 * hasher.update(second_block);
 * std::string hex = hasher.finish();
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();

    void update(std::span<const std::byte> data);
    void update(std::string_view data);

    /**
     * @brief Finalize and return the digest as lowercase hex
     *
     * The hasher is reset afterwards and can be reused.
     */
    [[nodiscard]] auto finish() -> std::string;

    void reset();

private:
    void process_block(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> buffer_;
    std::size_t buffered_;
    uint64_t total_bytes_;
};

/**
 * @brief Checksum helpers for object content
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @return Hash as lowercase hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return Hash as lowercase hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Check whether an oid is a SHA-256 content address (64 hex chars)
     */
    [[nodiscard]] static auto is_sha256_oid(std::string_view oid) -> bool;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_CORE_CHECKSUM_H
