#include "toolwire/codec.hpp"
#include "toolwire/error.hpp"
#include "toolwire/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace toolwire {

namespace {

// Convert a simdjson on-demand value to nlohmann::json recursively.
nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            switch (val.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(int64_t(val.get_int64()));
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(uint64_t(val.get_uint64()));
                case simdjson::ondemand::number_type::floating_point_number:
                    return nlohmann::json(double(val.get_double()));
                default:
                    throw McpParseError("Number out of range");
            }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unexpected JSON value");
    }
}

// Only integer and string ids are usable for an error reply.
std::optional<RequestId> recover_id(const nlohmann::json& j) {
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return RequestId{it->get<int64_t>()};
    if (it->is_string()) return RequestId{it->get<std::string>()};
    return std::nullopt;
}

RequestId read_id(const nlohmann::json& j) {
    const auto& id = j.at("id");
    if (id.is_null()) {
        throw McpParseError("'id' must not be null");
    }
    if (!id.is_number_integer() && !id.is_string()) {
        throw McpParseError("'id' must be an integer or a string");
    }
    RequestId out;
    from_json(id, out);
    return out;
}

std::string read_method(const nlohmann::json& j, const std::optional<RequestId>& id) {
    const auto& m = j.at("method");
    if (!m.is_string()) {
        throw McpParseError("'method' must be a string", id);
    }
    return m.get<std::string>();
}

} // anonymous namespace

JsonRpcMessage Codec::from_json_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }

    const auto id_hint = recover_id(j);

    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field", id_hint);
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'", id_hint);
    }

    const bool has_id = j.contains("id");
    const bool has_method = j.contains("method");

    if (has_method && has_id) {
        JsonRpcRequest req;
        req.id = read_id(j);
        req.method = read_method(j, req.id);
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        notif.method = read_method(j, std::nullopt);
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        JsonRpcResponse resp;
        // Error responses to undecodable input legitimately carry a null id.
        if (!j.at("id").is_null()) resp.id = read_id(j);

        const bool has_result = j.contains("result");
        const bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw McpParseError("Response must carry exactly one of 'result' or 'error'",
                                resp.id);
        }
        if (has_result) {
            resp.result = j.at("result");
        } else {
            const auto& e = j.at("error");
            if (!e.is_object() || !e.contains("code") || !e.at("code").is_number_integer()
                || !e.contains("message") || !e.at("message").is_string()) {
                throw McpParseError("Malformed 'error' object", resp.id);
            }
            resp.error = e.get<JsonRpcError>();
        }
        return resp;
    }
    throw McpParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    nlohmann::json j;
    try {
        simdjson::ondemand::document doc = parser.iterate(padded);
        simdjson::ondemand::json_type root_type = doc.type();
        if (root_type != simdjson::ondemand::json_type::object) {
            throw McpParseError("Message must be a JSON object");
        }
        j = to_nlohmann(doc.get_value());
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON message");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    return from_json_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Invalid UTF-8 from a handler must not make a reply unsendable.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace toolwire
