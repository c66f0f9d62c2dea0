/**
 * @file messages.cpp
 * @brief JSON mapping for custom transfer protocol messages
 */

#include <kcenon/transfer_adapter/protocol/messages.h>

namespace kcenon::transfer_adapter {

namespace {

// Absent and null both mean "not set"
auto has_field(const nlohmann::json& j, const char* key) -> bool {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

}  // namespace

void to_json(nlohmann::json& j, const object_error& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

void from_json(const nlohmann::json& j, object_error& e) {
    e.code = j.value("code", 0);
    e.message = j.value("message", std::string{});
}

void to_json(nlohmann::json& j, const action& a) {
    j = nlohmann::json{{"href", a.href}};
    if (!a.header.empty()) {
        j["header"] = a.header;
    }
    if (a.expires_at) {
        j["expires_at"] = *a.expires_at;
    }
}

void from_json(const nlohmann::json& j, action& a) {
    j.at("href").get_to(a.href);
    a.header.clear();
    if (has_field(j, "header")) {
        j.at("header").get_to(a.header);
    }
    a.expires_at.reset();
    if (has_field(j, "expires_at")) {
        a.expires_at = j.at("expires_at").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const init_request& m) {
    j = nlohmann::json{{"event", std::string(init_request::event_tag)},
                       {"operation", m.operation},
                       {"concurrent", m.concurrent},
                       {"concurrenttransfers", m.concurrent_transfers}};
}

void from_json(const nlohmann::json& j, init_request& m) {
    j.at("operation").get_to(m.operation);
    j.at("concurrent").get_to(m.concurrent);
    j.at("concurrenttransfers").get_to(m.concurrent_transfers);
}

void to_json(nlohmann::json& j, const init_response& m) {
    j = nlohmann::json::object();
    if (m.error) {
        j["error"] = *m.error;
    }
}

void from_json(const nlohmann::json& j, init_response& m) {
    m.error.reset();
    if (has_field(j, "error")) {
        m.error = j.at("error").get<object_error>();
    }
}

void to_json(nlohmann::json& j, const upload_request& m) {
    j = nlohmann::json{{"event", std::string(upload_request::event_tag)},
                       {"oid", m.oid},
                       {"size", m.size},
                       {"path", m.path},
                       {"action", m.link}};
}

void from_json(const nlohmann::json& j, upload_request& m) {
    j.at("oid").get_to(m.oid);
    j.at("size").get_to(m.size);
    j.at("path").get_to(m.path);
    j.at("action").get_to(m.link);
}

void to_json(nlohmann::json& j, const download_request& m) {
    j = nlohmann::json{{"event", std::string(download_request::event_tag)},
                       {"oid", m.oid},
                       {"size", m.size},
                       {"action", m.link}};
}

void from_json(const nlohmann::json& j, download_request& m) {
    j.at("oid").get_to(m.oid);
    j.at("size").get_to(m.size);
    j.at("action").get_to(m.link);
}

void to_json(nlohmann::json& j, const transfer_response& m) {
    j = nlohmann::json{{"event", std::string(transfer_response::event_tag)}, {"oid", m.oid}};
    if (m.path && !m.path->empty()) {
        j["path"] = *m.path;
    }
    if (m.error) {
        j["error"] = *m.error;
    }
}

void from_json(const nlohmann::json& j, transfer_response& m) {
    j.at("oid").get_to(m.oid);
    m.path.reset();
    if (has_field(j, "path")) {
        m.path = j.at("path").get<std::string>();
    }
    m.error.reset();
    if (has_field(j, "error")) {
        m.error = j.at("error").get<object_error>();
    }
}

void to_json(nlohmann::json& j, const progress_response& m) {
    j = nlohmann::json{{"event", std::string(progress_response::event_tag)},
                       {"oid", m.oid},
                       {"bytesSoFar", m.bytes_so_far},
                       {"bytesSinceLast", m.bytes_since_last}};
}

void from_json(const nlohmann::json& j, progress_response& m) {
    j.at("oid").get_to(m.oid);
    j.at("bytesSoFar").get_to(m.bytes_so_far);
    j.at("bytesSinceLast").get_to(m.bytes_since_last);
}

void to_json(nlohmann::json& j, const terminate_request& m) {
    j = nlohmann::json{{"event", std::string(terminate_request::event_tag)}, {"complete", m.complete}};
}

void from_json(const nlohmann::json& j, terminate_request& m) {
    j.at("complete").get_to(m.complete);
}

}  // namespace kcenon::transfer_adapter
