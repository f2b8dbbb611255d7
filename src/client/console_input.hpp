#pragma once

#include <atomic>
#include <deque>
#include <istream>
#include <memory>
#include <mutex>
#include <string>

namespace ghack::client {

// Lines typed at the console, handed from a reader thread to the main loop
class ConsoleInput {
public:
    // Reads on a detached thread that holds its own reference, so the queue
    // stays valid if the thread is still blocked in getline when main returns.
    // in must outlive the thread (std::cin does).
    static std::shared_ptr<ConsoleInput> start(std::istream& in);

    // Reads until end of input or a "quit" line, then marks the input done
    void read_lines(std::istream& in);

    // Lines queued since the last call
    std::deque<std::string> take();

    bool done() const { return done_; }

private:
    std::deque<std::string> lines_;
    std::mutex mutex_;
    std::atomic<bool> done_{false};
};

} // namespace ghack::client
