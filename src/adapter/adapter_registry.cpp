/**
 * @file adapter_registry.cpp
 * @brief Implementation of the adapter registry and configuration scan
 */

#include <kcenon/transfer_adapter/adapter/adapter_registry.h>

#include <algorithm>
#include <charconv>
#include <limits>

#include <kcenon/transfer_adapter/core/logging.h>

namespace kcenon::transfer_adapter {

namespace {

constexpr std::string_view CUSTOM_TRANSFER_SECTION = ".customtransfer.";
constexpr std::string_view PATH_SUFFIX = ".path";

// Read waits are handed to poll() as an int of milliseconds
constexpr int64_t MAX_TIMEOUT_SECONDS = std::numeric_limits<int>::max() / 1000;

/// Extract <name> from "<ns>.customtransfer.<name>.path"
auto adapter_name_from_key(std::string_view key, std::string_view ns)
    -> std::optional<std::string> {
    std::string prefix = std::string(ns) + std::string(CUSTOM_TRANSFER_SECTION);
    if (key.size() <= prefix.size() + PATH_SUFFIX.size() ||
        key.substr(0, prefix.size()) != prefix ||
        key.substr(key.size() - PATH_SUFFIX.size()) != PATH_SUFFIX) {
        return std::nullopt;
    }
    auto name = key.substr(prefix.size(), key.size() - prefix.size() - PATH_SUFFIX.size());
    if (name.empty() || name.find('.') != std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(name);
}

auto parse_timeout_seconds(std::string_view key, std::string_view value)
    -> result<std::chrono::milliseconds> {
    if (value.empty()) {
        return std::chrono::milliseconds{0};
    }
    int64_t seconds = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc{} || end != value.data() + value.size() || seconds < 0 ||
        seconds > MAX_TIMEOUT_SECONDS) {
        return unexpected{error{error_code::config_invalid,
                                std::string(key) + ": invalid timeout '" + std::string(value) +
                                    "', expected 0 to " + std::to_string(MAX_TIMEOUT_SECONDS) +
                                    " seconds"}};
    }
    return std::chrono::milliseconds{seconds * 1000};
}

auto read_definition(const config_source& source,
                     const std::string& key_base,
                     std::string name,
                     std::string path) -> result<adapter_definition> {
    adapter_definition definition;
    definition.name = std::move(name);
    definition.path = std::move(path);

    if (definition.path.empty()) {
        return unexpected{error{error_code::config_invalid,
                                key_base + ".path: custom transfer path is empty"}};
    }

    definition.args = source.get(key_base + ".args").value_or("");

    auto concurrent = get_bool(source, key_base + ".concurrent", true);
    if (!concurrent) {
        return unexpected{concurrent.error()};
    }
    definition.concurrent = concurrent.value();

    auto direction = parse_adapter_direction(source.get(key_base + ".direction").value_or(""));
    if (!direction) {
        return unexpected{error{error_code::invalid_direction,
                                key_base + ".direction: " + direction.error().message}};
    }
    definition.direction = direction.value();

    const std::string timeout_key = key_base + ".readtimeout";
    auto timeout = parse_timeout_seconds(timeout_key, source.get(timeout_key).value_or(""));
    if (!timeout) {
        return unexpected{timeout.error()};
    }
    definition.read_timeout = timeout.value();

    return definition;
}

}  // namespace

auto adapter_registry::register_adapter(transfer_direction direction,
                                        adapter_definition definition) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    key_type key{definition.name, direction};
    if (definitions_.count(key) != 0) {
        return unexpected{error{error_code::adapter_conflict,
                                "custom transfer \"" + definition.name +
                                    "\" is already registered for " +
                                    std::string(to_string(direction))}};
    }
    definitions_.emplace(std::move(key),
                         std::make_shared<const adapter_definition>(std::move(definition)));
    return {};
}

auto adapter_registry::find(std::string_view name, transfer_direction direction) const
    -> std::shared_ptr<const adapter_definition> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = definitions_.find(key_type{std::string(name), direction});
    return it == definitions_.end() ? nullptr : it->second;
}

auto adapter_registry::contains(std::string_view name, transfer_direction direction) const
    -> bool {
    return find(name, direction) != nullptr;
}

auto adapter_registry::names(transfer_direction direction) const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result_names;
    for (const auto& [key, definition] : definitions_) {
        if (key.second == direction) {
            result_names.push_back(key.first);
        }
    }
    return result_names;
}

auto adapter_registry::create(std::string_view name,
                              transfer_direction direction,
                              adapter_services services) const
    -> result<std::unique_ptr<transfer_adapter>> {
    auto definition = find(name, direction);
    if (!definition) {
        return unexpected{error{error_code::adapter_not_found,
                                "no custom transfer \"" + std::string(name) +
                                    "\" registered for " + std::string(to_string(direction))}};
    }
    return std::unique_ptr<transfer_adapter>(
        std::make_unique<custom_adapter>(std::move(definition), direction, std::move(services)));
}

auto configure_custom_adapters(const config_source& source,
                               adapter_registry& registry,
                               std::string_view ns) -> configure_report {
    configure_report report;

    for (const auto& [key, value] : source.entries()) {
        auto name = adapter_name_from_key(key, ns);
        if (!name) {
            continue;
        }

        const std::string key_base =
            std::string(ns) + std::string(CUSTOM_TRANSFER_SECTION) + *name;
        auto definition = read_definition(source, key_base, *name, value);
        if (!definition) {
            TA_LOG_WARN(log_category::registry,
                        "skipping custom transfer \"" + *name + "\": " +
                            definition.error().message);
            report.errors.push_back(definition.error());
            continue;
        }

        bool registered_any = false;
        for (auto direction : {transfer_direction::download, transfer_direction::upload}) {
            if (!includes(definition.value().direction, direction)) {
                continue;
            }
            auto registered = registry.register_adapter(direction, definition.value());
            if (!registered) {
                TA_LOG_WARN(log_category::registry, registered.error().message);
                report.errors.push_back(registered.error());
                continue;
            }
            registered_any = true;
        }

        if (registered_any) {
            transfer_log_context log_ctx;
            log_ctx.adapter = *name;
            TA_LOG_INFO_CTX(log_category::registry,
                            "registered custom transfer for " +
                                std::string(to_string(definition.value().direction)),
                            log_ctx);
            report.registered.push_back(*name);
        }
    }
    return report;
}

}  // namespace kcenon::transfer_adapter
