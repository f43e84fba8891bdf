#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace deckhand::cli {

// Console output for the command line front ends. Safe to use from the io
// thread and the main thread at once.
class Terminal {
public:
    void PrintInfo(const std::string& message);
    void PrintSuccess(const std::string& message);
    void PrintError(const std::string& message);
    void PrintLine(const std::string& line);
    void PrintPrompt();

    // nullopt on end of input
    std::optional<std::string> ReadLine();
    std::optional<std::string> Ask(const std::string& question);

private:
    std::mutex mutex_;
};

} // namespace deckhand::cli
