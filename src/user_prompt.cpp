#include "user_prompt.hpp"
#include "colors.hpp"
#include "config.hpp"
#include "errors.hpp"

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::string ConsolePrompt::ask(const std::string& question) {
    out_ << Colors::paint(Colors::YELLOW, question) << " " << std::flush;
    std::string response;
    if (!std::getline(in_, response)) {
        out_ << std::endl;
        throw AutocommitError::user("Failed to read input: end of input");
    }
    return trim(response);
}
