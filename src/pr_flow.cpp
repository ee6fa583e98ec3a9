#include "flows.hpp"
#include "change_collector.hpp"
#include "clarification_loop.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "spinner.hpp"

namespace {

const size_t MAX_LISTED_FILES = 10;

} // namespace

PrFlow::PrFlow(VersionControl& vcs, Forge& forge, GenerationClient& client, Presenter& presenter,
               FlowOptions options, int max_clarification_rounds)
    : vcs_(vcs), forge_(forge), client_(client), presenter_(presenter),
      options_(options), max_clarification_rounds_(max_clarification_rounds) {}

int PrFlow::run() {
    std::optional<std::string> current_branch = vcs_.get_current_branch();
    if (!current_branch || current_branch->empty()) {
        throw AutocommitError::user("Not on a branch. Please checkout a branch first.");
    }

    ChangeCollector collector(vcs_);
    std::string base_branch = collector.detect_default_branch();
    presenter_.info("Current branch: " + *current_branch);
    presenter_.info("Base branch: " + base_branch);

    if (*current_branch == base_branch) {
        throw AutocommitError::user("You are on the base branch (" + base_branch + "). Create a feature branch first.");
    }

    if (std::optional<std::string> existing = forge_.existing_pr_url()) {
        presenter_.info("A PR already exists for this branch: " + *existing);
        return 0;
    }

    if (!options_.dry_run) {
        bool remote_exists = vcs_.remote_branch_exists(*current_branch);
        AheadBehind status = vcs_.get_ahead_behind();
        if (!remote_exists || status.ahead > 0) {
            vcs_.push_current_branch();
        }
    }

    presenter_.info("\nGathering commit information...");
    ChangeSet changes = collector.collect_branch(base_branch);
    std::optional<std::string> pr_template = load_pr_template(vcs_.get_repo_root());

    if (changes.files.empty()) {
        throw AutocommitError::user("No changes found compared to base branch.");
    }

    presenter_.show_files("Changed files", changes.files, MAX_LISTED_FILES);
    presenter_.show_truncation_note(shaper_.shape(changes.diff), shaper_.budget());

    presenter_.info("Generating PR description...");
    ClarificationLoop loop(client_, shaper_, presenter_, max_clarification_rounds_);
    PrDraft draft = loop.run(changes, pr_template).draft;

    presenter_.show_pr_preview(draft);

    if (options_.dry_run) {
        presenter_.info("[dry-run] Would create PR with the above content.");
        return 0;
    }

    while (!options_.yes) {
        ReviewDecision decision = presenter_.review_pr();
        if (decision.action == ReviewAction::Accept) {
            break;
        }
        if (decision.action == ReviewAction::Cancel) {
            presenter_.info("PR creation cancelled.");
            return 0;
        }
        presenter_.info("\nAdjusting PR based on your feedback...");
        draft = with_spinner(options_.show_spinner, "Updating PR description...", [&] {
            return client_.generate_pr_draft(shaper_.pr_update_prompt(draft.title, draft.body, decision.feedback));
        });
        presenter_.show_pr_preview(draft, "UPDATED PR PREVIEW");
    }

    if (trim(draft.title).empty()) {
        throw AutocommitError::user("The generated PR has no title. Run again with more context.");
    }

    presenter_.info("\nCreating PR...");
    std::string url = forge_.create_pr(draft.title, draft.body, base_branch, *current_branch);
    presenter_.success(url);
    return 0;
}
