#pragma once

#include "generation_client.hpp"
#include "prompt_shaper.hpp"
#include "user_prompt.hpp"
#include <ostream>
#include <string>
#include <vector>

enum class ReviewAction { Accept, Cancel, Revise };

struct ReviewDecision {
    ReviewAction action = ReviewAction::Accept;
    std::string feedback;
};

// Boxed title/body preview, `width` columns wide.
std::string render_pr_preview(const PrDraft& draft, const std::string& heading, int width);

class Presenter {
public:
    Presenter(std::ostream& out, UserPrompt& prompt);

    void show_files(const std::string& heading, const std::vector<std::string>& files, size_t limit);
    void show_truncation_note(const ShapedDiff& diff, size_t budget);
    void show_commit_message(const std::string& message);
    void show_pr_preview(const PrDraft& draft, const std::string& heading = "PR PREVIEW");
    void info(const std::string& message);
    void success(const std::string& message);
    void show_committed(const std::string& hash, const std::string& message);

    bool confirm_commit();
    // Y or empty accepts, n cancels, anything else is feedback.
    ReviewDecision review_pr();
    std::string ask(const std::string& question);

private:
    std::ostream& out_;
    UserPrompt& prompt_;
};
