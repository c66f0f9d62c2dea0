/**
 * @file line_codec.h
 * @brief Line framing and one-of-N decoding for protocol messages
 * @version 0.1.0
 *
 * A line is one JSON object followed by a single '\n'. Decoding picks the
 * message type from an ordered candidate list:
 *
 * 1. If the line carries an `event` string naming one of the candidates,
 *    only that candidate is decoded.
 * 2. Otherwise each candidate is tried in order and the first one that
 *    decodes wins. Put the more specific schema first: a progress line also
 *    satisfies the completion schema, so `<progress_response,
 *    transfer_response>` is the correct order.
 */

#ifndef KCENON_TRANSFER_ADAPTER_PROTOCOL_LINE_CODEC_H
#define KCENON_TRANSFER_ADAPTER_PROTOCOL_LINE_CODEC_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "kcenon/transfer_adapter/core/types.h"
#include "kcenon/transfer_adapter/protocol/messages.h"

namespace kcenon::transfer_adapter {

/// Longest line accepted from a transfer process
inline constexpr std::size_t max_line_length = 1024 * 1024;

/**
 * @brief Serialize one message as a protocol line, terminator included
 */
template <typename Message>
[[nodiscard]] auto encode_line(const Message& message) -> result<std::string> {
    try {
        nlohmann::json j = message;
        std::string line = j.dump();
        line.push_back('\n');
        return line;
    } catch (const nlohmann::json::exception& e) {
        return unexpected{error{error_code::protocol_encode_failed,
                                std::string("cannot encode ") +
                                    std::string(Message::message_name) + ": " + e.what()}};
    }
}

namespace detail {

template <typename Variant, std::size_t Index, typename Candidate>
void try_candidate(const nlohmann::json& j,
                   std::string_view tag,
                   std::optional<Variant>& decoded,
                   std::string& reason) {
    if (decoded) return;
    if (!tag.empty() && Candidate::event_tag != tag) return;

    try {
        decoded.emplace(std::in_place_index<Index>, j.template get<Candidate>());
    } catch (const nlohmann::json::exception& e) {
        // Not this schema; the reason is kept for the error message
        reason = std::string(Candidate::message_name) + ": " + e.what();
    }
}

template <typename Variant, typename... Candidates, std::size_t... Index>
void probe_candidates(const nlohmann::json& j,
                      std::string_view tag,
                      std::optional<Variant>& decoded,
                      std::string& reason,
                      std::index_sequence<Index...>) {
    (try_candidate<Variant, Index, Candidates>(j, tag, decoded, reason), ...);
}

template <typename... Candidates>
auto candidate_names() -> std::string {
    std::string names;
    ((names += (names.empty() ? "" : ", ") + std::string(Candidates::message_name)), ...);
    return names;
}

}  // namespace detail

/**
 * @brief Decode a line into the first matching candidate message
 *
 * @tparam Candidates Acceptable message types, in priority order
 * @param line One line without its terminator
 * @return The decoded message; `index()` tells which candidate matched
 */
template <typename... Candidates>
[[nodiscard]] auto decode_line(std::string_view line)
    -> result<std::variant<Candidates...>> {
    using variant_type = std::variant<Candidates...>;

    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return unexpected{error{error_code::protocol_unparseable,
                                "cannot parse line \"" + std::string(line) + "\""}};
    }
    if (!j.is_object()) {
        return unexpected{error{error_code::protocol_unexpected_response,
                                "line \"" + std::string(line) + "\" is not a JSON object"}};
    }

    std::string tag;
    if (auto it = j.find("event"); it != j.end() && it->is_string()) {
        const auto& event = it->get_ref<const std::string&>();
        if (((Candidates::event_tag == event) || ...)) {
            tag = event;
        }
    }

    std::optional<variant_type> decoded;
    std::string reason;
    detail::probe_candidates<variant_type, Candidates...>(
        j, tag, decoded, reason, std::index_sequence_for<Candidates...>{});

    if (!decoded) {
        std::string message = "response \"" + std::string(line) +
                              "\" did not match any of the expected responses (" +
                              detail::candidate_names<Candidates...>() + ")";
        if (!reason.empty()) {
            message += ": " + reason;
        }
        return unexpected{error{error_code::protocol_unexpected_response, std::move(message)}};
    }
    return std::move(*decoded);
}

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_PROTOCOL_LINE_CODEC_H
