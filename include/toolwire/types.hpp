#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire {

// ---------- Annotations ----------

struct Annotations {
    std::optional<std::vector<std::string>> audience; // "user", "assistant"
    std::optional<double> priority;                   // 0.0 .. 1.0
    std::optional<std::string> last_modified;         // ISO 8601

    bool operator==(const Annotations& o) const {
        return audience == o.audience && priority == o.priority
               && last_modified == o.last_modified;
    }
};

// ---------- Content items ----------

struct TextContent {
    std::string text;
    std::optional<Annotations> annotations;

    bool operator==(const TextContent& o) const {
        return text == o.text && annotations == o.annotations;
    }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type && annotations == o.annotations;
    }
};

struct AudioContent {
    std::string data;       // base64
    std::string mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const AudioContent& o) const {
        return data == o.data && mime_type == o.mime_type && annotations == o.annotations;
    }
};

struct ResourceLink {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const ResourceLink& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type && annotations == o.annotations;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64
    std::optional<Annotations> annotations;

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob && annotations == o.annotations;
    }
};

using Content = std::variant<TextContent, ImageContent, AudioContent,
                             ResourceLink, EmbeddedResource>;

// ---------- Tools ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};
    std::optional<nlohmann::json> output_schema;
    std::optional<nlohmann::json> annotations;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && output_schema == o.output_schema
               && annotations == o.annotations;
    }
};

/// Outcome of a tool call. is_error reports a tool-level failure that is
/// still delivered as a successful JSON-RPC response.
struct CallToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }

    static CallToolResult text(std::string s) {
        CallToolResult r;
        r.content.push_back(TextContent{std::move(s), std::nullopt});
        return r;
    }

    static CallToolResult error_text(std::string s) {
        CallToolResult r = text(std::move(s));
        r.is_error = true;
        return r;
    }
};

struct ListToolsResult {
    std::vector<ToolDefinition> tools;
    std::optional<std::string> next_cursor;

    bool operator==(const ListToolsResult& o) const {
        return tools == o.tools && next_cursor == o.next_cursor;
    }
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && experimental == o.experimental;
    }
};

struct ClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> elicitation;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ClientCapabilities& o) const {
        return roots == o.roots && sampling == o.sampling && elicitation == o.elicitation
               && experimental == o.experimental;
    }
};

// ---------- Initialization ----------

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    std::optional<Implementation> client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Annotations& a);
void from_json(const nlohmann::json& j, Annotations& a);

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);

void to_json(nlohmann::json& j, const AudioContent& t);
void from_json(const nlohmann::json& j, AudioContent& t);

void to_json(nlohmann::json& j, const ResourceLink& t);
void from_json(const nlohmann::json& j, ResourceLink& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ListToolsResult& t);
void from_json(const nlohmann::json& j, ListToolsResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace toolwire
