#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cmdschema/schema/command_schema.hpp"

namespace cmdschema::schema {

// One argument as it appears in a declaration, before validation.
// `type` and `kind` are kept as text so unknown spellings can be reported.
struct RawArgument {
    std::string name;
    std::string type = "string";
    std::string kind = "option";
    bool required = false;
    std::optional<std::string> default_value;
    std::vector<std::string> choices;
    std::string description;
    bool variadic = false;
};

// A command declaration as produced by a loader
struct RawDeclaration {
    std::string name;
    std::string description;
    std::vector<RawArgument> arguments;
    std::vector<std::string> agents;
    std::string source;  // where it was read from, for diagnostics only
};

/**
 * @brief Converts raw declarations into validated CommandSchemas.
 *
 * Rules are checked in a fixed order and the first failure is thrown as an
 * errors::InvalidSchemaError:
 *   1. BadName             - name must match ^[a-z][a-z0-9-]*$
 *   2. UnknownType         - empty argument name, unknown type or kind
 *   3. DuplicateArgument   - argument names unique within the command
 *   4. MissingChoices      - choice arguments need at least one choice
 *   5. DefaultTypeMismatch - defaults must coerce to the declared type
 *   6. PositionalOrder     - required positionals before optional ones,
 *                            at most one variadic and only in last position
 */
class SchemaParser {
public:
    static CommandSchema parse(const RawDeclaration& declaration);

    static bool is_valid_command_name(const std::string& name);
};

}  // namespace cmdschema::schema
