#pragma once

#include "change_collector.hpp"
#include "generation_client.hpp"
#include "presenter.hpp"
#include "prompt_shaper.hpp"
#include <optional>
#include <string>
#include <vector>

// Asked when the model wants clarification but sends no question.
extern const std::string GENERIC_CLARIFICATION_QUESTION;

enum class ClarificationState {
    Drafting,
    AwaitingAnswer,
    Accepted,
    ClarificationSkipped
};

struct ClarificationRound {
    std::string question;
    std::string answer;
};

struct ClarificationOutcome {
    PrDraft draft;
    ClarificationState state = ClarificationState::Drafting;
    std::vector<ClarificationRound> rounds;
    int engine_calls = 0;
    bool hit_round_limit = false;
};

// Drafts a PR and refines it with the user's answers until the model stops
// asking, the user skips, or max_rounds refinements have been made.
class ClarificationLoop {
public:
    ClarificationLoop(GenerationClient& client, const PromptShaper& shaper, Presenter& presenter, int max_rounds);

    ClarificationOutcome run(const ChangeSet& changes, const std::optional<std::string>& pr_template);

private:
    GenerationClient& client_;
    const PromptShaper& shaper_;
    Presenter& presenter_;
    int max_rounds_;
};
