#include "spinner.hpp"
#include "colors.hpp"
#include <iostream>
#include <chrono>

Spinner::Spinner(std::string_view label) : label_(label), running_(true) {
    thread_ = std::thread([this]() {
        const int width = 10;
        int position = 0;
        int direction = 1;  // 1 for right, -1 for left
        auto start = std::chrono::steady_clock::now();
        size_t last_length = 0;
        while (running_) {
            std::string bar = "[";
            for (int i = 0; i < width; ++i) {
                bar += (i == position) ? Colors::paint(Colors::GREEN, "█") : std::string(" ");
            }
            bar += "]";
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count();
            std::string seconds = " " + std::to_string(elapsed) + "s";
            last_length = label_.size() + width + 3 + seconds.size();
            std::cout << "\r" << Colors::paint(Colors::GREEN, label_) << " " << bar << seconds << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            position += direction;
            if (position == width - 1 || position == 0) {
                direction = -direction;
            }
        }
        std::cout << "\r" << std::string(last_length + 1, ' ') << "\r" << std::flush;
    });
}

Spinner::~Spinner() {
    stop();
}

void Spinner::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}
