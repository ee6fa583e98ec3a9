#pragma once

#include <iostream>
#include <string>

// Blocking "ask the user" capability.
class UserPrompt {
public:
    virtual ~UserPrompt() = default;
    // Returns the trimmed answer; empty means the user just pressed Enter.
    virtual std::string ask(const std::string& question) = 0;
};

class ConsolePrompt : public UserPrompt {
public:
    ConsolePrompt(std::istream& in = std::cin, std::ostream& out = std::cout);
    std::string ask(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};
