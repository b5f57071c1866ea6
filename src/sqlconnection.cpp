#include "sqlconnection.hpp"

#include "lib.hpp"

namespace orodb {

bool SQLRow::has(const std::string& column) const {
    for (const auto& c : cols_) {
        if (c.first == column) return true;
    }
    return false;
}

std::optional<std::string> SQLRow::get(const std::string& column) const {
    for (const auto& c : cols_) {
        if (c.first == column) return c.second;
    }
    return std::nullopt;
}

std::string SQLRow::text(const std::string& column) const {
    for (const auto& c : cols_) {
        if (c.first == column) return c.second.value_or("");
    }
    ORODB_THROW("row has no column '%s'", column.c_str());
}

} // namespace orodb
