#include "toolwire/schema.hpp"
#include <nlohmann/json-schema.hpp>
#include <algorithm>
#include <cstring>
#include <exception>
#include <regex>
#include <utility>

namespace toolwire {

namespace {

using nlohmann::json;

struct KeywordRule {
    const char* fragment;
    const char* keyword;
};

// The validator reports messages, not keywords. Checked in order: the
// combinator and additional-property messages embed a nested message.
constexpr KeywordRule kKeywordRules[] = {
    {"additional property '", "additionalProperties"},
    {"required property '", "required"},
    {"at least one subschema has failed", "allOf"},
    {"Type: oneOf", "oneOf"},
    {"more than one subschema has succeeded", "oneOf"},
    {"no subschema has succeeded", "anyOf"},
    {"required to not validate", "not"},
    {"invalid as per false-schema", "false"},
    {"unexpected instance type", "type"},
    {"not found in required enum", "enum"},
    {"instance not const", "const"},
    {"as per maxLength", "maxLength"},
    {"as per minLength", "minLength"},
    {"does not match regex pattern", "pattern"},
    {"exceeds or equals maximum", "exclusiveMaximum"},
    {"exceeds maximum", "maximum"},
    {"below or equals minimum", "exclusiveMinimum"},
    {"below minimum", "minimum"},
    {"not a multiple of", "multipleOf"},
    {"too many items", "maxItems"},
    {"too few items", "minItems"},
    {"have to be unique", "uniqueItems"},
    {"'contains'", "contains"},
    {"too many properties", "maxProperties"},
    {"too few properties", "minProperties"},
    {"propertyNames", "propertyNames"},
    {"dependenc", "dependencies"},
};

const char* keyword_for(const std::string& message) {
    for (const auto& rule : kKeywordRules) {
        if (message.find(rule.fragment) != std::string::npos) return rule.keyword;
    }
    return "schema";
}

// Name quoted right after `fragment`, e.g. "required property 'x' not found".
std::string quoted_name(const std::string& message, const char* fragment) {
    size_t start = message.find(fragment);
    if (start == std::string::npos) return {};
    start += std::strlen(fragment);
    size_t end = message.find('\'', start);
    if (end == std::string::npos) return {};
    return message.substr(start, end - start);
}

class ViolationCollector : public nlohmann::json_schema::error_handler {
public:
    explicit ViolationCollector(std::vector<Violation>& out) : out_(out) {}

    void error(const json::json_pointer& ptr, const json& /*instance*/,
               const std::string& message) override {
        const char* keyword = keyword_for(message);
        std::string path = ptr.to_string();

        // Point at the member itself rather than its parent object.
        if (std::strcmp(keyword, "required") == 0) {
            auto name = quoted_name(message, "required property '");
            if (!name.empty()) path = (ptr / name).to_string();
        } else if (std::strcmp(keyword, "additionalProperties") == 0) {
            auto name = quoted_name(message, "additional property '");
            if (!name.empty()) path = (ptr / name).to_string();
        }
        out_.push_back(Violation{std::move(path), keyword, message});
    }

private:
    std::vector<Violation>& out_;
};

// Finds strings the validator would hand to a regex that are too long to
// match safely. It follows every subschema the validator may apply, so it
// errs on the side of reporting.
class PatternGuard {
public:
    PatternGuard(const json& root, std::vector<Violation>& out) : root_(root), out_(out) {}

    void walk(const json& schema, const json& v, const json::json_pointer& ptr, int depth) {
        if (depth > kMaxDepth || !schema.is_object()) return;

        auto ref = schema.find("$ref");
        if (ref != schema.end() && ref->is_string()) {
            if (const json* target = resolve(ref->get_ref<const std::string&>())) {
                walk(*target, v, ptr, depth + 1);
            }
        }

        if (v.is_string() && schema.contains("pattern")) {
            const size_t n = v.get_ref<const std::string&>().size();
            if (n > kMaxPatternSubject) {
                add(ptr, "pattern", "string of " + std::to_string(n)
                                    + " bytes is too long to match against a pattern (limit "
                                    + std::to_string(kMaxPatternSubject) + ")");
            }
        }
        if (v.is_object()) walk_object(schema, v, ptr, depth);
        if (v.is_array()) walk_array(schema, v, ptr, depth);

        for (const char* key : {"allOf", "anyOf", "oneOf"}) {
            auto it = schema.find(key);
            if (it == schema.end() || !it->is_array()) continue;
            for (const auto& sub : *it) walk(sub, v, ptr, depth + 1);
        }
        for (const char* key : {"not", "if", "then", "else"}) {
            auto it = schema.find(key);
            if (it != schema.end()) walk(*it, v, ptr, depth + 1);
        }
    }

private:
    static constexpr int kMaxDepth = 64;

    void walk_object(const json& schema, const json& v, const json::json_pointer& ptr, int depth) {
        static const json kEmpty = json::object();
        auto props_it = schema.find("properties");
        const json& props = (props_it != schema.end() && props_it->is_object()) ? *props_it : kEmpty;
        auto pattern_props = schema.find("patternProperties");
        auto additional = schema.find("additionalProperties");
        auto names = schema.find("propertyNames");

        for (auto field = v.begin(); field != v.end(); ++field) {
            const std::string& key = field.key();
            const auto child = ptr / key;

            auto prop = props.find(key);
            if (prop != props.end()) walk(*prop, field.value(), child, depth + 1);

            if (pattern_props != schema.end() && pattern_props->is_object()) {
                if (key.size() > kMaxPatternSubject) {
                    add(child, "patternProperties", "property name of " + std::to_string(key.size())
                                                    + " bytes is too long to match against a pattern");
                }
                for (const auto& sub : *pattern_props) walk(sub, field.value(), child, depth + 1);
            }
            if (additional != schema.end() && prop == props.end()) {
                walk(*additional, field.value(), child, depth + 1);
            }
            if (names != schema.end()) walk(*names, json(key), child, depth + 1);
        }

        auto deps = schema.find("dependencies");
        if (deps != schema.end() && deps->is_object()) {
            for (const auto& dep : *deps) walk(dep, v, ptr, depth + 1);
        }
    }

    void walk_array(const json& schema, const json& v, const json::json_pointer& ptr, int depth) {
        auto items = schema.find("items");
        size_t positional = 0;
        if (items != schema.end() && items->is_array()) {
            positional = std::min(items->size(), v.size());
            for (size_t i = 0; i < positional; ++i) {
                walk((*items)[i], v[i], ptr / i, depth + 1);
            }
            auto extra = schema.find("additionalItems");
            if (extra != schema.end()) {
                for (size_t i = positional; i < v.size(); ++i) walk(*extra, v[i], ptr / i, depth + 1);
            }
        } else if (items != schema.end()) {
            for (size_t i = 0; i < v.size(); ++i) walk(*items, v[i], ptr / i, depth + 1);
        }

        auto contains = schema.find("contains");
        if (contains != schema.end()) {
            for (size_t i = 0; i < v.size(); ++i) walk(*contains, v[i], ptr / i, depth + 1);
        }
    }

    const json* resolve(const std::string& ref) const {
        if (ref == "#") return &root_;
        if (ref.size() < 2 || ref[0] != '#' || ref[1] != '/') return nullptr;
        try {
            json::json_pointer target(ref.substr(1));
            if (!root_.contains(target)) return nullptr;
            return &root_.at(target);
        } catch (const json::exception&) {
            return nullptr;
        }
    }

    void add(const json::json_pointer& ptr, const char* keyword, std::string message) {
        std::string path = ptr.to_string();
        for (const auto& v : out_) {
            if (v.path == path && v.keyword == keyword) return;
        }
        out_.push_back(Violation{std::move(path), keyword, std::move(message)});
    }

    const json& root_;
    std::vector<Violation>& out_;
};

} // anonymous namespace

void to_json(nlohmann::json& j, const Violation& v) {
    j = {{"path", v.path}, {"keyword", v.keyword}, {"message", v.message}};
}

nlohmann::json ValidationResult::to_error_data() const {
    return nlohmann::json{{"violations", violations}};
}

SchemaValidator::SchemaValidator(const nlohmann::json& schema)
    : schema_(schema) {
    // Formats are annotations here; an empty checker accepts all of them.
    auto validator = std::make_unique<nlohmann::json_schema::json_validator>(
        nullptr, [](const std::string&, const std::string&) {});
    try {
        validator->set_root_schema(schema_);
        validator_ = std::move(validator);
    } catch (const std::regex_error& e) {
        compile_errors_.push_back(Violation{
            "", "pattern", std::string("schema pattern is not a valid regular expression: ") + e.what()});
    } catch (const std::exception& e) {
        compile_errors_.push_back(Violation{
            "", "schema", std::string("schema cannot be compiled: ") + e.what()});
    }
}

SchemaValidator::~SchemaValidator() = default;

ValidationResult SchemaValidator::validate(const nlohmann::json& instance) const {
    ValidationResult result;
    if (!validator_) {
        result.violations = compile_errors_;
        return result;
    }

    PatternGuard(schema_, result.violations).walk(schema_, instance, json::json_pointer(), 0);
    if (!result.ok()) return result;

    ViolationCollector collector(result.violations);
    try {
        validator_->validate(instance, collector);
    } catch (const std::exception& e) {
        result.violations.push_back(Violation{"", "schema", e.what()});
    }
    return result;
}

ValidationResult SchemaValidator::validate(const nlohmann::json& schema,
                                           const nlohmann::json& instance) {
    return SchemaValidator(schema).validate(instance);
}

} // namespace toolwire
