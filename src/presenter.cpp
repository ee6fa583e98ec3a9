#include "presenter.hpp"
#include "colors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/terminal.hpp>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return std::tolower(ch); });
    return s;
}

int preview_width() {
    int width = ftxui::Terminal::Size().dimx;
    return std::max(40, std::min(width, 100));
}

} // namespace

std::string render_pr_preview(const PrDraft& draft, const std::string& heading, int width) {
    ftxui::Elements body_lines;
    std::istringstream stream(draft.body);
    std::string line;
    while (std::getline(stream, line)) {
        body_lines.push_back(line.empty() ? ftxui::text(" ") : ftxui::paragraph(line));
    }
    if (body_lines.empty()) {
        body_lines.push_back(ftxui::text("(empty)") | ftxui::dim);
    }

    auto document = ftxui::vbox({
        ftxui::text(heading) | ftxui::bold | ftxui::center,
        ftxui::separator(),
        ftxui::paragraph("Title: " + draft.title),
        ftxui::separator(),
        ftxui::vbox(std::move(body_lines)),
    }) | ftxui::border;

    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(width), ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    return screen.ToString();
}

Presenter::Presenter(std::ostream& out, UserPrompt& prompt) : out_(out), prompt_(prompt) {}

void Presenter::show_files(const std::string& heading, const std::vector<std::string>& files, size_t limit) {
    out_ << Colors::paint(Colors::GREEN, heading + " (" + std::to_string(files.size()) + "):") << "\n";
    for (size_t i = 0; i < files.size() && i < limit; ++i) {
        out_ << "  " << files[i] << "\n";
    }
    if (files.size() > limit) {
        out_ << "  ... and " << (files.size() - limit) << " more\n";
    }
    out_ << std::endl;
}

void Presenter::show_truncation_note(const ShapedDiff& diff, size_t budget) {
    if (diff.truncated()) {
        out_ << Colors::paint(Colors::YELLOW, "Note: Diff was truncated (" + std::to_string(diff.original_length)
                              + " chars -> " + std::to_string(budget) + " chars)") << std::endl;
    }
}

void Presenter::show_commit_message(const std::string& message) {
    out_ << "\n" << Colors::paint(Colors::GREEN, "Generated commit message:") << "\n"
         << message << "\n" << std::endl;
}

void Presenter::show_pr_preview(const PrDraft& draft, const std::string& heading) {
    out_ << "\n" << render_pr_preview(draft, heading, preview_width()) << std::endl;
}

void Presenter::info(const std::string& message) {
    out_ << message << std::endl;
}

void Presenter::success(const std::string& message) {
    out_ << Colors::paint(Colors::GREEN, message) << std::endl;
}

void Presenter::show_committed(const std::string& hash, const std::string& message) {
    out_ << Colors::paint(Colors::BLUE, "[" + hash + "]") << " " << message << std::endl;
}

bool Presenter::confirm_commit() {
    std::string response = to_lower(prompt_.ask("Commit with this message? [Y/n]"));
    return response.empty() || response == "y" || response == "yes";
}

ReviewDecision Presenter::review_pr() {
    std::string response = prompt_.ask("Is this PR ready to create? (Y/n/comment)");
    std::string lower = to_lower(response);
    ReviewDecision decision;
    if (lower.empty() || lower == "y" || lower == "yes") {
        decision.action = ReviewAction::Accept;
    } else if (lower == "n" || lower == "no") {
        decision.action = ReviewAction::Cancel;
    } else {
        decision.action = ReviewAction::Revise;
        decision.feedback = response;
    }
    return decision;
}

std::string Presenter::ask(const std::string& question) {
    return prompt_.ask(question);
}
