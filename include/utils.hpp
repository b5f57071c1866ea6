#pragma once
#include <string>

namespace orodb {

// Escape '\', '%' and '_' so @p text matches literally inside LIKE/ILIKE
// patterns (with the default backslash escape).
std::string escape_ilike(const std::string& text);

// ASCII lowercased, runs of ASCII non-alphanumerics collapsed to '_', trimmed.
// Non-ASCII UTF-8 is kept unchanged.
// "Add users table!" -> "add_users_table"
std::string slugify(const std::string& text);

// Double-quoted SQL identifier, embedded quotes doubled.
std::string quote_ident(const std::string& name);

} // namespace orodb
