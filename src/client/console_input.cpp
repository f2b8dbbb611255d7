#include "console_input.hpp"
#include <thread>
#include <utility>

namespace ghack::client {

std::shared_ptr<ConsoleInput> ConsoleInput::start(std::istream& in) {
    auto input = std::make_shared<ConsoleInput>();
    std::thread reader([input, &in]() { input->read_lines(in); });
    reader.detach();
    return input;
}

void ConsoleInput::read_lines(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        bool quit = line == "quit";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(std::move(line));
        }
        if (quit) break;
    }
    done_ = true;
}

std::deque<std::string> ConsoleInput::take() {
    std::deque<std::string> lines;
    std::lock_guard<std::mutex> lock(mutex_);
    std::swap(lines, lines_);
    return lines;
}

} // namespace ghack::client
