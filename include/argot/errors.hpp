#ifndef ARGOT_ERRORS_HPP
#define ARGOT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace argot {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Build-time problems with a command definition: duplicate names, index gaps, bad ranges.
class InitializationError : public Error {
public:
    using Error::Error;
};

// Thrown by converters. The message describes the failure, e.g. "'abc' is not an int".
class ConversionFailure : public Error {
public:
    using Error::Error;
};

// Parse-time problem with the user's input.
//
// Instances are copyable and are stored by value in ParseResult::errors() when the
// parser collects errors. Subclass-only details (such as the unmatched token list) are
// available from the ParseResult in that mode.
class ParameterError : public Error {
public:
    enum class Kind {
        MissingParameter,
        TypeConversion,
        MalformedMapEntry,
        OverwrittenOption,
        UnmatchedArgument,
        MaxValuesExceeded,
    };

    ParameterError(Kind kind, std::string message, std::string argument = {}, std::string value = {}, std::string cause = {})
        : Error(std::move(message)),
          kind_(kind),
          argument_(std::move(argument)),
          value_(std::move(value)),
          cause_(std::move(cause)) {}

    [[nodiscard]] Kind kind() const { return kind_; }
    // Display name of the argument, e.g. "option '-x' (<x>)". Empty for unmatched input.
    [[nodiscard]] const std::string& argument() const { return argument_; }
    // The raw input implicated in the failure.
    [[nodiscard]] const std::string& value() const { return value_; }
    // Underlying converter message, if any.
    [[nodiscard]] const std::string& cause() const { return cause_; }

private:
    Kind kind_;
    std::string argument_;
    std::string value_;
    std::string cause_;
};

class MissingParameterError : public ParameterError {
public:
    MissingParameterError(std::string message, std::string argument, std::string value = {})
        : ParameterError(Kind::MissingParameter, std::move(message), std::move(argument), std::move(value)) {}
};

class TypeConversionError : public ParameterError {
public:
    TypeConversionError(std::string message, std::string argument, std::string value, std::string cause)
        : ParameterError(Kind::TypeConversion, std::move(message), std::move(argument), std::move(value), std::move(cause)) {}
};

class OverwrittenOptionError : public ParameterError {
public:
    OverwrittenOptionError(std::string message, std::string argument, std::string value)
        : ParameterError(Kind::OverwrittenOption, std::move(message), std::move(argument), std::move(value)) {}
};

class UnmatchedArgumentError : public ParameterError {
public:
    UnmatchedArgumentError(std::string message, std::vector<std::string> unmatched, std::vector<std::string> suggestions = {})
        : ParameterError(Kind::UnmatchedArgument,
                         std::move(message),
                         {},
                         unmatched.empty() ? std::string() : unmatched.front()),
          unmatched_(std::move(unmatched)),
          suggestions_(std::move(suggestions)) {}

    [[nodiscard]] const std::vector<std::string>& unmatched() const { return unmatched_; }
    [[nodiscard]] const std::vector<std::string>& suggestions() const { return suggestions_; }

private:
    std::vector<std::string> unmatched_;
    std::vector<std::string> suggestions_;
};

} // namespace argot

#endif // ARGOT_ERRORS_HPP
