#pragma once

#include <nlohmann/json.hpp>

#include "cmdschema/catalog/catalog.hpp"
#include "cmdschema/errors/errors.hpp"
#include "cmdschema/resolver/invocation_context.hpp"
#include "cmdschema/schema/command_schema.hpp"

namespace cmdschema::serialization {

// JSON views of cmdschema results, used by the command line front end.
// Unset values are rendered as null; the `set` list tells them apart from
// explicit values.

nlohmann::json value_to_json(const schema::ArgumentValue& value);
nlohmann::json optional_value_to_json(const resolver::OptionalValue& value);

nlohmann::json argument_to_json(const schema::ArgumentSpec& spec);
nlohmann::json schema_to_json(const schema::CommandSchema& schema);

nlohmann::json context_to_json(const resolver::InvocationContext& context);

// code, message and the fields specific to the concrete error type
nlohmann::json error_to_json(const errors::Error& error);

nlohmann::json load_result_to_json(const catalog::CatalogLoadResult& result);

}  // namespace cmdschema::serialization
