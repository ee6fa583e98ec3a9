#pragma once

#include "forge.hpp"
#include "generation_client.hpp"
#include "git_utils.hpp"
#include "presenter.hpp"
#include "prompt_shaper.hpp"

struct FlowOptions {
    bool yes = false;       // skip confirmation
    bool dry_run = false;   // generate but do not apply
    bool show_spinner = true;
};

// Staged changes -> commit message -> commit.
class CommitFlow {
public:
    CommitFlow(VersionControl& vcs, GenerationClient& client, Presenter& presenter, FlowOptions options);

    // Returns the process exit code; failures are thrown.
    int run();

private:
    VersionControl& vcs_;
    GenerationClient& client_;
    Presenter& presenter_;
    FlowOptions options_;
    PromptShaper shaper_;
};

// Branch changes -> PR draft (with clarification) -> review -> PR.
class PrFlow {
public:
    PrFlow(VersionControl& vcs, Forge& forge, GenerationClient& client, Presenter& presenter,
           FlowOptions options, int max_clarification_rounds);

    int run();

private:
    VersionControl& vcs_;
    Forge& forge_;
    GenerationClient& client_;
    Presenter& presenter_;
    FlowOptions options_;
    int max_clarification_rounds_;
    PromptShaper shaper_;
};
