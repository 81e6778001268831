#include "cmdschema/serialization/json_report.hpp"

namespace cmdschema::serialization {

using nlohmann::json;

json value_to_json(const schema::ArgumentValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

json optional_value_to_json(const resolver::OptionalValue& value) {
    return value ? value_to_json(*value) : json(nullptr);
}

json argument_to_json(const schema::ArgumentSpec& spec) {
    json j = {{"name", spec.name},
              {"kind", schema::argument_kind_to_string(spec.kind)},
              {"type", schema::argument_type_to_string(spec.type)},
              {"required", spec.required}};
    if (!spec.choices.empty()) j["choices"] = spec.choices;
    if (spec.default_value) j["default"] = value_to_json(*spec.default_value);
    if (spec.variadic) j["variadic"] = true;
    if (!spec.description.empty()) j["description"] = spec.description;
    return j;
}

json schema_to_json(const schema::CommandSchema& schema) {
    json arguments = json::array();
    for (const auto& spec : schema.arguments()) {
        arguments.push_back(argument_to_json(spec));
    }
    json j = {{"name", schema.name()},
              {"arguments", arguments},
              {"agents", schema.agent_refs()}};
    if (!schema.description().empty()) j["description"] = schema.description();
    return j;
}

json context_to_json(const resolver::InvocationContext& context) {
    json values = json::object();
    json set = json::array();
    for (const auto& [name, value] : context.values()) {
        values[name] = optional_value_to_json(value);
        if (value) set.push_back(name);
    }
    json provided = json::array();
    for (const auto& [name, value] : context.values()) {
        if (context.is_user_provided(name)) provided.push_back(name);
    }
    return {{"command", context.command()},
            {"values", values},
            {"set", set},
            {"provided", provided},
            {"raw_options", context.raw_options()}};
}

json error_to_json(const errors::Error& error) {
    json j = {{"code", errors::error_code_to_string(error.code())},
              {"message", error.what()}};

    if (auto e = dynamic_cast<const errors::InvalidSchemaError*>(&error)) {
        j["kind"] = errors::schema_error_kind_to_string(e->kind());
        j["command"] = e->command();
    } else if (auto e =
                   dynamic_cast<const errors::DuplicateCommandError*>(&error)) {
        j["command"] = e->command();
    } else if (auto e = dynamic_cast<
                   const errors::DanglingAgentReferenceError*>(&error)) {
        j["command"] = e->command();
        j["agent"] = e->agent();
    } else if (auto e = dynamic_cast<const errors::DeclarationFormatError*>(
                   &error)) {
        j["source"] = e->source();
    } else if (auto e =
                   dynamic_cast<const errors::UnknownCommandError*>(&error)) {
        j["command"] = e->command();
    } else if (auto e =
                   dynamic_cast<const errors::MissingArgumentError*>(&error)) {
        j["command"] = e->command();
        j["argument"] = e->argument();
    } else if (auto e =
                   dynamic_cast<const errors::UnknownOptionError*>(&error)) {
        j["command"] = e->command();
        j["flag"] = e->flag();
    } else if (auto e = dynamic_cast<const errors::UnexpectedArgumentError*>(
                   &error)) {
        j["command"] = e->command();
        j["token"] = e->token();
    } else if (auto e =
                   dynamic_cast<const errors::TypeCoercionError*>(&error)) {
        j["argument"] = e->argument();
        j["value"] = e->value();
        j["expected_type"] = e->expected_type();
    } else if (auto e =
                   dynamic_cast<const errors::InvalidChoiceError*>(&error)) {
        j["argument"] = e->argument();
        j["value"] = e->value();
        j["allowed"] = e->allowed();
    }
    return j;
}

json load_result_to_json(const catalog::CatalogLoadResult& result) {
    json failures = json::array();
    for (const auto& failure : result.failures) {
        json entry = {{"source", failure.source},
                      {"code", errors::error_code_to_string(failure.code)},
                      {"message", failure.message}};
        if (failure.error) {
            try {
                std::rethrow_exception(failure.error);
            } catch (const errors::Error& e) {
                entry.update(error_to_json(e));
                entry["source"] = failure.source;
            }
        }
        failures.push_back(entry);
    }

    json dangling = json::array();
    for (const auto& err : result.dangling) {
        dangling.push_back(
            json{{"command", err.command()}, {"agent", err.agent()}});
    }

    return {{"ok", result.ok()},
            {"commands", result.commands},
            {"agents", result.agents},
            {"skipped", result.skipped},
            {"failures", failures},
            {"dangling_agent_references", dangling}};
}

}  // namespace cmdschema::serialization
