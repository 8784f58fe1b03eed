#include "toolwire/types.hpp"
#include <stdexcept>

namespace toolwire {

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

} // anonymous namespace

// ---------- Annotations ----------

void to_json(nlohmann::json& j, const Annotations& a) {
    j = nlohmann::json::object();
    if (a.audience) j["audience"] = *a.audience;
    if (a.priority) j["priority"] = *a.priority;
    if (a.last_modified) j["lastModified"] = *a.last_modified;
}

void from_json(const nlohmann::json& j, Annotations& a) {
    read_optional(j, "audience", a.audience);
    read_optional(j, "priority", a.priority);
    read_optional(j, "lastModified", a.last_modified);
}

// ---------- Content items ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
    read_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
    read_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const AudioContent& t) {
    j = {{"type", "audio"}, {"data", t.data}, {"mimeType", t.mime_type}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, AudioContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
    read_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const ResourceLink& t) {
    j = {{"type", "resource_link"}, {"uri", t.uri}, {"name", t.name}};
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ResourceLink& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.at("name").get<std::string>();
    read_optional(j, "description", t.description);
    read_optional(j, "mimeType", t.mime_type);
    read_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource{{"uri", t.uri}};
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", std::move(resource)}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    t.uri = resource.at("uri").get<std::string>();
    read_optional(resource, "mimeType", t.mime_type);
    read_optional(resource, "text", t.text);
    read_optional(resource, "blob", t.blob);
    read_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "audio") {
        c = j.get<AudioContent>();
    } else if (type == "resource_link") {
        c = j.get<ResourceLink>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- Tools ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.output_schema) j["outputSchema"] = *t.output_schema;
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    read_optional(j, "title", t.title);
    read_optional(j, "description", t.description);
    if (j.contains("outputSchema")) t.output_schema = j.at("outputSchema");
    if (j.contains("annotations")) t.annotations = j.at("annotations");
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        content.push_back(std::move(cj));
    }
    j = {{"content", std::move(content)}};
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content.clear();
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    t.is_error = j.value("isError", false);
}

void to_json(nlohmann::json& j, const ListToolsResult& t) {
    j = {{"tools", t.tools}};
    if (t.next_cursor) j["nextCursor"] = *t.next_cursor;
}

void from_json(const nlohmann::json& j, ListToolsResult& t) {
    t.tools = j.at("tools").get<std::vector<ToolDefinition>>();
    read_optional(j, "nextCursor", t.next_cursor);
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.elicitation) j["elicitation"] = *t.elicitation;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("elicitation")) t.elicitation = j.at("elicitation");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

// ---------- Initialization ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string{});
    read_optional(j, "title", t.title);
}

void from_json(const nlohmann::json& j, InitializeParams& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    if (j.contains("capabilities") && j.at("capabilities").is_object()) {
        t.capabilities = j.at("capabilities").get<ClientCapabilities>();
    }
    read_optional(j, "clientInfo", t.client_info);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    read_optional(j, "instructions", t.instructions);
}

} // namespace toolwire
