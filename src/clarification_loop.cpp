#include "clarification_loop.hpp"
#include <spdlog/spdlog.h>

const std::string GENERIC_CLARIFICATION_QUESTION =
    "The model needs more context about these changes. What should it know? (leave empty to proceed)";

ClarificationLoop::ClarificationLoop(GenerationClient& client, const PromptShaper& shaper, Presenter& presenter, int max_rounds)
    : client_(client), shaper_(shaper), presenter_(presenter), max_rounds_(max_rounds) {}

ClarificationOutcome ClarificationLoop::run(const ChangeSet& changes, const std::optional<std::string>& pr_template) {
    ClarificationOutcome outcome;
    outcome.state = ClarificationState::Drafting;
    outcome.draft = client_.generate_pr_draft(shaper_.pr_prompt(changes, pr_template, std::nullopt));
    outcome.engine_calls = 1;

    int refinements = 0;
    while (outcome.draft.needs_clarification) {
        if (refinements >= max_rounds_) {
            spdlog::warn("Model still requests clarification after {} rounds; accepting the latest draft", refinements);
            outcome.draft.needs_clarification = false;
            outcome.draft.clarification_question.clear();
            outcome.hit_round_limit = true;
            break;
        }

        outcome.state = ClarificationState::AwaitingAnswer;
        std::string question = outcome.draft.clarification_question.empty()
            ? GENERIC_CLARIFICATION_QUESTION
            : outcome.draft.clarification_question;

        presenter_.info("\nClarification needed:");
        std::string answer = presenter_.ask(question);
        outcome.rounds.push_back({question, answer});

        if (answer.empty()) {
            presenter_.info("Proceeding without additional context...");
            outcome.draft.needs_clarification = false;
            outcome.draft.clarification_question.clear();
            outcome.state = ClarificationState::ClarificationSkipped;
            return outcome;
        }

        // Only the latest answer is sent; earlier rounds are not replayed.
        outcome.state = ClarificationState::Drafting;
        outcome.draft = client_.generate_pr_draft(shaper_.pr_prompt(changes, pr_template, answer));
        ++outcome.engine_calls;
        ++refinements;
    }

    outcome.state = ClarificationState::Accepted;
    return outcome;
}
