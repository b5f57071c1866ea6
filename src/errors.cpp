#include "errors.hpp"

#include "jsonhlp.hpp"

namespace orodb {

namespace {

    ErrorDetails field_details(const std::optional<std::string>& field, const std::optional<std::string>& value) {
        ErrorDetails d;
        if (field) d["field"] = *field;
        if (value) d["value"] = *value;
        return d;
    }

    std::string join(const std::vector<std::string>& items, const char* sep) {
        std::string out;
        for (const auto& it : items) {
            if (!out.empty()) out += sep;
            out += it;
        }
        return out;
    }

} // namespace

OroDbError::OroDbError(const std::string& message, ErrorDetails details)
    : std::runtime_error(message)
    , message_(message)
    , details_(std::move(details)) { }

std::string OroDbError::to_json() const {
    jdoc doc;
    doc.SetObject();
    auto& a = doc.GetAllocator();
    jhlp::set(doc, "error", std::string(type_name()));
    jhlp::set(doc, "message", message_);

    jval details(json::kObjectType);
    for (const auto& [key, value] : details_) {
        jhlp::set(details, key, value, a);
    }
    doc.AddMember("details", details, a);
    return jhlp::stringify(doc);
}

ValidationError::ValidationError(const std::string& message,
    std::optional<std::string> field,
    std::optional<std::string> value)
    : OroDbError(message, field_details(field, value))
    , field_(std::move(field))
    , value_(std::move(value)) { }

ConfigError::ConfigError(const std::string& message, std::vector<std::string> missing_vars)
    : OroDbError(message, missing_vars.empty() ? ErrorDetails {} : ErrorDetails { { "missing_vars", join(missing_vars, ",") } })
    , missing_vars_(std::move(missing_vars)) { }

NotFoundError::NotFoundError(const std::string& resource_type, const std::string& resource_id)
    : OroDbError(resource_type + " not found: " + resource_id,
          { { "resource_type", resource_type }, { "resource_id", resource_id } })
    , resource_type_(resource_type)
    , resource_id_(resource_id) { }

ConflictError::ConflictError(const std::string& message, std::optional<std::string> existing_id)
    : OroDbError(message, existing_id ? ErrorDetails { { "existing_id", *existing_id } } : ErrorDetails {})
    , existing_id_(std::move(existing_id)) { }

} // namespace orodb
