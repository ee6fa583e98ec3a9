#pragma once

#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

// Precondition not met: no staged changes, on the base branch, ...
struct UserError {
    std::string message;
};

// A version-control or forge operation failed.
struct ExternalToolError {
    std::string message;
    std::string command;
    std::string stderr_output;
};

enum class GenerationFailure {
    MissingCredential,
    UnexpectedResponseShape,
    ResponseParseError,
    ApiError,
    TransportError
};

struct GenerationError {
    GenerationFailure failure;
    std::string message;
    std::string raw_response;
};

struct UnexpectedError {
    std::string message;
};

using ErrorKind = std::variant<UserError, ExternalToolError, GenerationError, UnexpectedError>;

class AutocommitError : public std::runtime_error {
public:
    explicit AutocommitError(ErrorKind kind);

    const ErrorKind& kind() const { return kind_; }

    static AutocommitError user(const std::string& message);
    static AutocommitError tool(const std::string& message, const std::string& command, const std::string& stderr_output);
    static AutocommitError generation(GenerationFailure failure, const std::string& message, const std::string& raw_response = "");

private:
    ErrorKind kind_;
};

std::string describe_error(const ErrorKind& kind);

// Prints the error the way its kind is shown to the user and returns the exit code.
int report_error(const ErrorKind& kind, std::ostream& err);

// Runs one entry-point flow, mapping every failure to exit code 1.
int run_guarded(const std::function<int()>& body, std::ostream& err);
