/**
 * @file config_source.h
 * @brief Key/value configuration access for adapter discovery
 * @version 0.1.0
 *
 * Adapters are declared with dotted keys in the style of git-config
 * (`lfs.customtransfer.<name>.path`). How those keys are loaded is the
 * host's business; this header only defines the view the registry reads.
 */

#ifndef KCENON_TRANSFER_ADAPTER_CONFIG_CONFIG_SOURCE_H
#define KCENON_TRANSFER_ADAPTER_CONFIG_CONFIG_SOURCE_H

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/transfer_adapter/core/types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Read-only view over a flat configuration key space
 */
class config_source {
public:
    virtual ~config_source() = default;

    /**
     * @brief All entries, ordered by key
     */
    [[nodiscard]] virtual auto entries() const -> std::map<std::string, std::string> = 0;

    /**
     * @brief Value of one key, if set
     */
    [[nodiscard]] virtual auto get(std::string_view key) const
        -> std::optional<std::string> = 0;
};

/**
 * @brief Map-backed configuration source
 *
 * @code
 * memory_config_source config;
 * config.set("lfs.customtransfer.testagent.path", "/usr/local/bin/agent");
 * config.set("lfs.customtransfer.testagent.concurrent", "false");
 * @endcode
 */
class memory_config_source : public config_source {
public:
    memory_config_source() = default;
    explicit memory_config_source(std::map<std::string, std::string> values)
        : values_(std::move(values)) {}

    void set(std::string key, std::string value) {
        values_[std::move(key)] = std::move(value);
    }

    void unset(const std::string& key) { values_.erase(key); }

    [[nodiscard]] auto entries() const -> std::map<std::string, std::string> override {
        return values_;
    }

    [[nodiscard]] auto get(std::string_view key) const
        -> std::optional<std::string> override {
        auto it = values_.find(std::string(key));
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> values_;
};

/**
 * @brief Parse a git-style boolean
 *
 * Accepts true/yes/on/1 and false/no/off/0 in any case. A key present with
 * an empty value counts as true.
 */
[[nodiscard]] auto parse_bool(std::string_view value) -> result<bool>;

/**
 * @brief Read a boolean key, falling back to a default when unset
 */
[[nodiscard]] auto get_bool(const config_source& source, std::string_view key,
                            bool default_value) -> result<bool>;

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_CONFIG_CONFIG_SOURCE_H
