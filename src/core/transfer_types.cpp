/**
 * @file transfer_types.cpp
 * @brief Implementation of transfer type helpers
 */

#include <kcenon/transfer_adapter/core/transfer_types.h>

#include <algorithm>
#include <cctype>

namespace kcenon::transfer_adapter {

auto parse_adapter_direction(std::string_view value) -> result<adapter_direction> {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "both") {
        return adapter_direction::both;
    }
    if (lowered == "upload") {
        return adapter_direction::upload;
    }
    if (lowered == "download") {
        return adapter_direction::download;
    }
    return unexpected{error{error_code::invalid_direction,
                            "invalid direction '" + std::string(value) +
                                "', expected upload, download or both"}};
}

}  // namespace kcenon::transfer_adapter
