#include "errors.hpp"
#include "colors.hpp"
#include <spdlog/spdlog.h>

namespace {

struct DescribeVisitor {
    std::string operator()(const UserError& e) const {
        return e.message;
    }
    std::string operator()(const ExternalToolError& e) const {
        return e.message + " (" + e.command + ")";
    }
    std::string operator()(const GenerationError& e) const {
        return e.message;
    }
    std::string operator()(const UnexpectedError& e) const {
        return e.message;
    }
};

std::string tool_label(const std::string& command) {
    if (command.rfind("git ", 0) == 0) return "Git error: ";
    if (command.rfind("gh ", 0) == 0) return "GitHub CLI error: ";
    return "Command failed: ";
}

const char* failure_label(GenerationFailure failure) {
    switch (failure) {
        case GenerationFailure::MissingCredential: return "Configuration error";
        case GenerationFailure::UnexpectedResponseShape: return "Unexpected response";
        case GenerationFailure::ResponseParseError: return "Response parse error";
        case GenerationFailure::ApiError: return "API error";
        case GenerationFailure::TransportError: return "Network error";
    }
    return "API error";
}

} // namespace

AutocommitError::AutocommitError(ErrorKind kind)
    : std::runtime_error(describe_error(kind)), kind_(std::move(kind)) {}

AutocommitError AutocommitError::user(const std::string& message) {
    return AutocommitError(UserError{message});
}

AutocommitError AutocommitError::tool(const std::string& message, const std::string& command, const std::string& stderr_output) {
    return AutocommitError(ExternalToolError{message, command, stderr_output});
}

AutocommitError AutocommitError::generation(GenerationFailure failure, const std::string& message, const std::string& raw_response) {
    return AutocommitError(GenerationError{failure, message, raw_response});
}

std::string describe_error(const ErrorKind& kind) {
    return std::visit(DescribeVisitor{}, kind);
}

int report_error(const ErrorKind& kind, std::ostream& err) {
    if (const auto* e = std::get_if<UserError>(&kind)) {
        err << e->message << std::endl;
    } else if (const auto* e = std::get_if<ExternalToolError>(&kind)) {
        err << Colors::paint(Colors::RED, tool_label(e->command)) << e->message << std::endl;
        err << "Command: " << e->command << std::endl;
        if (!e->stderr_output.empty()) {
            err << "Details: " << e->stderr_output << std::endl;
        }
    } else if (const auto* e = std::get_if<GenerationError>(&kind)) {
        err << Colors::paint(Colors::RED, std::string(failure_label(e->failure)) + ": ") << e->message << std::endl;
        if (!e->raw_response.empty()) {
            err << "Response: " << e->raw_response << std::endl;
        }
    } else if (const auto* e = std::get_if<UnexpectedError>(&kind)) {
        err << Colors::paint(Colors::RED, "Unexpected error: ") << e->message << std::endl;
    }
    return 1;
}

int run_guarded(const std::function<int()>& body, std::ostream& err) {
    try {
        return body();
    } catch (const AutocommitError& e) {
        spdlog::debug("Flow aborted: {}", e.what());
        return report_error(e.kind(), err);
    } catch (const std::exception& e) {
        return report_error(UnexpectedError{e.what()}, err);
    }
}
