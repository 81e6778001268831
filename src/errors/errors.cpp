#include "cmdschema/errors/errors.hpp"

#include <algorithm>
#include <sstream>

namespace cmdschema::errors {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

std::string describe_dangling(
    const std::vector<DanglingAgentReferenceError>& errors) {
    std::ostringstream oss;
    oss << errors.size() << " dangling agent reference(s)";
    for (const auto& err : errors) {
        oss << "\n  " << err.what();
    }
    return oss.str();
}

}  // namespace

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidSchema:
            return "InvalidSchema";
        case ErrorCode::DuplicateCommand:
            return "DuplicateCommand";
        case ErrorCode::DanglingAgentReference:
            return "DanglingAgentReference";
        case ErrorCode::RegistryValidation:
            return "RegistryValidation";
        case ErrorCode::RegistryState:
            return "RegistryState";
        case ErrorCode::DeclarationFormat:
            return "DeclarationFormat";
        case ErrorCode::UnknownCommand:
            return "UnknownCommand";
        case ErrorCode::MissingArgument:
            return "MissingArgument";
        case ErrorCode::UnknownOption:
            return "UnknownOption";
        case ErrorCode::UnexpectedArgument:
            return "UnexpectedArgument";
        case ErrorCode::TypeCoercion:
            return "TypeCoercion";
        case ErrorCode::InvalidChoice:
            return "InvalidChoice";
    }
    return "Unknown";
}

std::string schema_error_kind_to_string(SchemaErrorKind kind) {
    switch (kind) {
        case SchemaErrorKind::BadName:
            return "BadName";
        case SchemaErrorKind::UnknownType:
            return "UnknownType";
        case SchemaErrorKind::DuplicateArgument:
            return "DuplicateArgument";
        case SchemaErrorKind::MissingChoices:
            return "MissingChoices";
        case SchemaErrorKind::DefaultTypeMismatch:
            return "DefaultTypeMismatch";
        case SchemaErrorKind::PositionalOrder:
            return "PositionalOrder";
    }
    return "Unknown";
}

InvalidSchemaError::InvalidSchemaError(SchemaErrorKind kind,
                                       const std::string& command,
                                       const std::string& detail)
    : LoadError(ErrorCode::InvalidSchema,
                "Invalid schema '" + command +
                    "' (" + schema_error_kind_to_string(kind) + "): " + detail),
      kind_(kind),
      command_(command),
      detail_(detail) {}

DuplicateCommandError::DuplicateCommandError(const std::string& command)
    : LoadError(ErrorCode::DuplicateCommand,
                "Command already registered: " + command),
      command_(command) {}

DanglingAgentReferenceError::DanglingAgentReferenceError(
    const std::string& command, const std::string& agent)
    : LoadError(ErrorCode::DanglingAgentReference,
                "Command '" + command + "' references unknown agent '" +
                    agent + "'"),
      command_(command),
      agent_(agent) {}

RegistryValidationError::RegistryValidationError(
    std::vector<DanglingAgentReferenceError> errors)
    : LoadError(ErrorCode::RegistryValidation, describe_dangling(errors)),
      errors_(std::move(errors)) {}

DeclarationFormatError::DeclarationFormatError(const std::string& source,
                                               const std::string& detail)
    : LoadError(ErrorCode::DeclarationFormat,
                "Malformed declaration in " + source + ": " + detail),
      source_(source) {}

UnknownCommandError::UnknownCommandError(const std::string& command)
    : ClonableInvocationError(ErrorCode::UnknownCommand,
                              "Unknown command: " + command),
      command_(command) {}

MissingArgumentError::MissingArgumentError(const std::string& command,
                                           const std::string& argument)
    : ClonableInvocationError(ErrorCode::MissingArgument,
                              "Missing required argument '" + argument +
                                  "' for command '" + command + "'"),
      command_(command),
      argument_(argument) {}

UnknownOptionError::UnknownOptionError(const std::string& command,
                                       const std::string& flag)
    : ClonableInvocationError(
          ErrorCode::UnknownOption,
          "Unknown option '--" + flag + "' for command '" + command + "'"),
      command_(command),
      flag_(flag) {}

UnexpectedArgumentError::UnexpectedArgumentError(const std::string& command,
                                                 const std::string& token)
    : ClonableInvocationError(ErrorCode::UnexpectedArgument,
                              "Unexpected argument '" + token +
                                  "' for command '" + command + "'"),
      command_(command),
      token_(token) {}

TypeCoercionError::TypeCoercionError(const std::string& argument,
                                     const std::string& value,
                                     const std::string& expected_type)
    : ClonableInvocationError(ErrorCode::TypeCoercion,
                              "Argument '" + argument + "' expects " +
                                  expected_type + ", got '" + value + "'"),
      argument_(argument),
      value_(value),
      expected_type_(expected_type) {}

InvalidChoiceError::InvalidChoiceError(const std::string& argument,
                                       const std::string& value,
                                       std::vector<std::string> allowed)
    : ClonableInvocationError(ErrorCode::InvalidChoice,
                              "Invalid value '" + value + "' for argument '" +
                                  argument + "', allowed: " + join(allowed)),
      argument_(argument),
      value_(value),
      allowed_(std::move(allowed)) {}

}  // namespace cmdschema::errors
