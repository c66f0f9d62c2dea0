/**
 * @file config_source.cpp
 * @brief Implementation of configuration value parsing
 */

#include <kcenon/transfer_adapter/config/config_source.h>

#include <algorithm>
#include <cctype>

namespace kcenon::transfer_adapter {

auto parse_bool(std::string_view value) -> result<bool> {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "true" || lowered == "yes" ||
        lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    return unexpected{error{error_code::invalid_boolean,
                            "invalid boolean value '" + std::string(value) + "'"}};
}

auto get_bool(const config_source& source, std::string_view key, bool default_value)
    -> result<bool> {
    auto value = source.get(key);
    if (!value) {
        return default_value;
    }
    auto parsed = parse_bool(*value);
    if (!parsed) {
        return unexpected{error{error_code::invalid_boolean,
                                std::string(key) + ": " + parsed.error().message}};
    }
    return parsed.value();
}

}  // namespace kcenon::transfer_adapter
