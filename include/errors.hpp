#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace orodb {

using ErrorDetails = std::map<std::string, std::string>;

/**
 * Root of every failure raised by orodb.
 *
 * Carries a plain message plus a flat key/value details map; to_json()
 * renders {"error": <type>, "message": ..., "details": {...}}.
 */
class OroDbError : public std::runtime_error {
public:
    explicit OroDbError(const std::string& message, ErrorDetails details = {});

    const std::string& message() const noexcept { return message_; }
    const ErrorDetails& details() const noexcept { return details_; }

    virtual const char* type_name() const noexcept { return "OroDbError"; }
    std::string to_json() const;

protected:
    std::string message_;
    ErrorDetails details_;
};

// Connection, query and pool failures.
class DatabaseError : public OroDbError {
public:
    using OroDbError::OroDbError;
    const char* type_name() const noexcept override { return "DatabaseError"; }
};

class ValidationError : public OroDbError {
public:
    explicit ValidationError(const std::string& message,
        std::optional<std::string> field = std::nullopt,
        std::optional<std::string> value = std::nullopt);

    const std::optional<std::string>& field() const noexcept { return field_; }
    const std::optional<std::string>& value() const noexcept { return value_; }
    const char* type_name() const noexcept override { return "ValidationError"; }

private:
    std::optional<std::string> field_;
    std::optional<std::string> value_;
};

class ConfigError : public OroDbError {
public:
    explicit ConfigError(const std::string& message, std::vector<std::string> missing_vars = {});

    const std::vector<std::string>& missing_vars() const noexcept { return missing_vars_; }
    const char* type_name() const noexcept override { return "ConfigError"; }

private:
    std::vector<std::string> missing_vars_;
};

class NotFoundError : public OroDbError {
public:
    NotFoundError(const std::string& resource_type, const std::string& resource_id);

    const std::string& resource_type() const noexcept { return resource_type_; }
    const std::string& resource_id() const noexcept { return resource_id_; }
    const char* type_name() const noexcept override { return "NotFoundError"; }

private:
    std::string resource_type_;
    std::string resource_id_;
};

// State violations: the operation conflicts with what is already recorded.
class ConflictError : public OroDbError {
public:
    explicit ConflictError(const std::string& message, std::optional<std::string> existing_id = std::nullopt);

    const std::optional<std::string>& existing_id() const noexcept { return existing_id_; }
    const char* type_name() const noexcept override { return "ConflictError"; }

private:
    std::optional<std::string> existing_id_;
};

} // namespace orodb
