#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nlohmann {
namespace json_schema {
class json_validator;
} // namespace json_schema
} // namespace nlohmann

namespace toolwire {

/// One violated constraint.
struct Violation {
    std::string path;     // JSON Pointer into the instance ("" is the root)
    std::string keyword;  // schema keyword that failed ("required", "type", ...)
    std::string message;

    bool operator==(const Violation& o) const {
        return path == o.path && keyword == o.keyword && message == o.message;
    }
};

void to_json(nlohmann::json& j, const Violation& v);

struct ValidationResult {
    std::vector<Violation> violations;

    bool ok() const { return violations.empty(); }
    explicit operator bool() const { return ok(); }

    /// {"violations": [...]} for the error response's data member.
    nlohmann::json to_error_data() const;
};

/// Strings longer than this (in bytes) are rejected instead of being
/// matched against a `pattern`; the regex engine recurses per character.
constexpr size_t kMaxPatternSubject = 4096;

/// Tool argument validation against a draft-7 JSON Schema, backed by
/// nlohmann::json_schema. Every violation is reported, not only the
/// first. `format` is accepted as an annotation and not checked.
class SchemaValidator {
public:
    /// Compiles `schema`. Never throws; a schema that does not compile
    /// (a malformed pattern, say) makes every validate() report why.
    explicit SchemaValidator(const nlohmann::json& schema);
    ~SchemaValidator();

    SchemaValidator(const SchemaValidator&) = delete;
    SchemaValidator& operator=(const SchemaValidator&) = delete;

    [[nodiscard]] ValidationResult validate(const nlohmann::json& instance) const;

    /// Compile and validate in one go.
    [[nodiscard]] static ValidationResult validate(const nlohmann::json& schema,
                                                   const nlohmann::json& instance);

private:
    nlohmann::json schema_;
    std::unique_ptr<nlohmann::json_schema::json_validator> validator_;
    std::vector<Violation> compile_errors_;
};

} // namespace toolwire
