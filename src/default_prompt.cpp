#include "default_prompt.hpp"

const std::string COMMIT_MESSAGE_INSTRUCTIONS = R"PROMPT(Generate a concise git commit message for the following diff. The message should:
- Start with a type prefix (feat, fix, docs, style, refactor, test, chore)
- Be written in imperative mood
- Be a single line, max 72 characters
- Not include any explanation, just the commit message)PROMPT";

const std::string PR_DEFAULT_SECTIONS = R"PROMPT(Structure the PR body with these sections (only include sections relevant to the changes):
## Summary
Brief description of changes

## Changes
- Bullet points of specific changes

## Testing
How to test these changes
)PROMPT";

const std::string PR_TEMPLATE_INSTRUCTIONS =
    "Use this PR template as a guide for the body structure. IMPORTANT: Remove any sections from the template "
    "that are not relevant to the changes (e.g., if there are no breaking changes, remove the breaking changes "
    "section; if there are no migrations, remove the migration section).";

const std::string PR_JSON_FORMAT = R"PROMPT(Respond in JSON format:
{
  "title": "PR title (concise, max 72 chars)",
  "body": "PR description following the template",
  "needsClarification": false,
  "clarificationQuestion": null
}

If the changes are unclear or you need more context to write a good PR description, set needsClarification to true and provide a specific clarificationQuestion.

Only output valid JSON, no markdown code blocks.)PROMPT";

const std::string PR_UPDATE_JSON_FORMAT = R"PROMPT(Respond in JSON format:
{
  "title": "Updated PR title (concise, max 72 chars)",
  "body": "Updated PR description",
  "needsClarification": false,
  "clarificationQuestion": null
}

Only output valid JSON, no markdown code blocks.)PROMPT";
