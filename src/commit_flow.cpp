#include "flows.hpp"
#include "change_collector.hpp"
#include "spinner.hpp"

CommitFlow::CommitFlow(VersionControl& vcs, GenerationClient& client, Presenter& presenter, FlowOptions options)
    : vcs_(vcs), client_(client), presenter_(presenter), options_(options) {}

int CommitFlow::run() {
    ChangeCollector collector(vcs_);
    ChangeSet changes = collector.collect_staged();

    presenter_.show_files("Staged files", changes.files, changes.files.size());
    presenter_.show_truncation_note(shaper_.shape(changes.diff), shaper_.budget());

    std::string message = with_spinner(options_.show_spinner, "Generating commit message...", [&] {
        return client_.generate_commit_message(shaper_.commit_prompt(changes));
    });
    presenter_.show_commit_message(message);

    if (options_.dry_run) {
        presenter_.info("[dry-run] Would commit with the above message.");
        return 0;
    }

    if (!options_.yes && !presenter_.confirm_commit()) {
        presenter_.info("Commit cancelled.");
        return 0;
    }

    std::string hash = vcs_.commit(message);
    presenter_.show_committed(hash, message);
    return 0;
}
