#pragma once

#include <string>

extern const std::string COMMIT_MESSAGE_INSTRUCTIONS;
extern const std::string PR_DEFAULT_SECTIONS;
extern const std::string PR_TEMPLATE_INSTRUCTIONS;
extern const std::string PR_JSON_FORMAT;
extern const std::string PR_UPDATE_JSON_FORMAT;
