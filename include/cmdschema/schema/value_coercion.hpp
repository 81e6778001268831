#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cmdschema/schema/argument_spec.hpp"

namespace cmdschema::schema {

// Case-insensitive "true"/"false"; nullopt for anything else
std::optional<bool> parse_bool(const std::string& raw);

// Base-10, optional leading sign, no surrounding or trailing characters
std::optional<std::int64_t> parse_integer(const std::string& raw);

// Convert one raw token to the declared type of `spec`.
// Throws errors::TypeCoercionError or errors::InvalidChoiceError.
ArgumentValue coerce_value(const ArgumentSpec& spec, const std::string& raw);

}  // namespace cmdschema::schema
