#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <optional>
#include <string_view>

class Spinner {
public:
    Spinner(std::string_view label);
    ~Spinner();
    void stop();

private:
    std::string label_;
    std::atomic<bool> running_;
    std::thread thread_;
};

// Runs fn while a spinner is shown, when enabled.
template <typename Fn>
auto with_spinner(bool enabled, std::string_view label, Fn&& fn) {
    std::optional<Spinner> spinner;
    if (enabled) {
        spinner.emplace(label);
    }
    return fn();
}
