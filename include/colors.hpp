#pragma once

#include <string>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";     // Failures
    const std::string YELLOW = "\033[33m";  // Questions and notes
    const std::string GREEN = "\033[32m";   // Headings and results
    const std::string BLUE = "\033[34m";    // Commit hash

    inline std::string paint(const std::string& color, const std::string& text) {
        return color + text + RESET;
    }
}
