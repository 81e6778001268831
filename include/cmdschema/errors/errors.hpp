#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cmdschema::errors {

enum class ErrorCode {
    InvalidSchema,
    DuplicateCommand,
    DanglingAgentReference,
    RegistryValidation,
    RegistryState,
    DeclarationFormat,
    UnknownCommand,
    MissingArgument,
    UnknownOption,
    UnexpectedArgument,
    TypeCoercion,
    InvalidChoice
};

std::string error_code_to_string(ErrorCode code);

// Base class of every error raised by cmdschema
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Errors raised while building a Registry. Fatal to registry construction.
class LoadError : public Error {
public:
    LoadError(ErrorCode code, const std::string& message)
        : Error(code, message) {}
};

// Errors raised while resolving one invocation. Always recoverable.
class InvocationError : public Error {
public:
    InvocationError(ErrorCode code, const std::string& message)
        : Error(code, message) {}

    virtual std::unique_ptr<InvocationError> clone() const = 0;
};

// CRTP helper providing clone() for concrete invocation errors
template <typename Derived>
class ClonableInvocationError : public InvocationError {
public:
    ClonableInvocationError(ErrorCode code, const std::string& message)
        : InvocationError(code, message) {}

    std::unique_ptr<InvocationError> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

// ---------------------------------------------------------------------------
// Load-time errors
// ---------------------------------------------------------------------------

enum class SchemaErrorKind {
    BadName,
    UnknownType,
    DuplicateArgument,
    MissingChoices,
    DefaultTypeMismatch,
    PositionalOrder
};

std::string schema_error_kind_to_string(SchemaErrorKind kind);

class InvalidSchemaError : public LoadError {
public:
    InvalidSchemaError(SchemaErrorKind kind, const std::string& command,
                       const std::string& detail);

    SchemaErrorKind kind() const { return kind_; }
    const std::string& command() const { return command_; }
    const std::string& detail() const { return detail_; }

private:
    SchemaErrorKind kind_;
    std::string command_;
    std::string detail_;
};

class DuplicateCommandError : public LoadError {
public:
    explicit DuplicateCommandError(const std::string& command);

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

class DanglingAgentReferenceError : public LoadError {
public:
    DanglingAgentReferenceError(const std::string& command,
                                const std::string& agent);

    const std::string& command() const { return command_; }
    const std::string& agent() const { return agent_; }

    bool operator==(const DanglingAgentReferenceError& other) const {
        return command_ == other.command_ && agent_ == other.agent_;
    }
    bool operator!=(const DanglingAgentReferenceError& other) const {
        return !(*this == other);
    }
    bool operator<(const DanglingAgentReferenceError& other) const {
        if (command_ != other.command_) return command_ < other.command_;
        return agent_ < other.agent_;
    }

private:
    std::string command_;
    std::string agent_;
};

// Aggregate of every dangling reference found in one validation pass
class RegistryValidationError : public LoadError {
public:
    explicit RegistryValidationError(
        std::vector<DanglingAgentReferenceError> errors);

    const std::vector<DanglingAgentReferenceError>& errors() const {
        return errors_;
    }

private:
    std::vector<DanglingAgentReferenceError> errors_;
};

// Registry used in the wrong lifecycle phase (mutated after finalization,
// or read before a successful finalization)
class RegistryStateError : public LoadError {
public:
    explicit RegistryStateError(const std::string& message)
        : LoadError(ErrorCode::RegistryState, message) {}
};

// Malformed declaration source (YAML or Markdown frontmatter)
class DeclarationFormatError : public LoadError {
public:
    DeclarationFormatError(const std::string& source,
                           const std::string& detail);

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

// ---------------------------------------------------------------------------
// Invocation-time errors
// ---------------------------------------------------------------------------

class UnknownCommandError
    : public ClonableInvocationError<UnknownCommandError> {
public:
    explicit UnknownCommandError(const std::string& command);

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

class MissingArgumentError
    : public ClonableInvocationError<MissingArgumentError> {
public:
    MissingArgumentError(const std::string& command,
                         const std::string& argument);

    const std::string& command() const { return command_; }
    const std::string& argument() const { return argument_; }

private:
    std::string command_;
    std::string argument_;
};

class UnknownOptionError : public ClonableInvocationError<UnknownOptionError> {
public:
    UnknownOptionError(const std::string& command, const std::string& flag);

    const std::string& command() const { return command_; }
    const std::string& flag() const { return flag_; }

private:
    std::string command_;
    std::string flag_;
};

class UnexpectedArgumentError
    : public ClonableInvocationError<UnexpectedArgumentError> {
public:
    UnexpectedArgumentError(const std::string& command,
                            const std::string& token);

    const std::string& command() const { return command_; }
    const std::string& token() const { return token_; }

private:
    std::string command_;
    std::string token_;
};

class TypeCoercionError : public ClonableInvocationError<TypeCoercionError> {
public:
    TypeCoercionError(const std::string& argument, const std::string& value,
                      const std::string& expected_type);

    const std::string& argument() const { return argument_; }
    const std::string& value() const { return value_; }
    const std::string& expected_type() const { return expected_type_; }

private:
    std::string argument_;
    std::string value_;
    std::string expected_type_;
};

class InvalidChoiceError : public ClonableInvocationError<InvalidChoiceError> {
public:
    InvalidChoiceError(const std::string& argument, const std::string& value,
                       std::vector<std::string> allowed);

    const std::string& argument() const { return argument_; }
    const std::string& value() const { return value_; }
    const std::vector<std::string>& allowed() const { return allowed_; }

private:
    std::string argument_;
    std::string value_;
    std::vector<std::string> allowed_;
};

}  // namespace cmdschema::errors
