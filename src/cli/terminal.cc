#include <cli/terminal.h>
#include <iostream>
#include <string>

namespace deckhand::cli {

void Terminal::PrintInfo(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "\033[36m[INFO] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintSuccess(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "\033[32m[OK] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << std::endl;
}

void Terminal::PrintPrompt() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "> ";
    std::cout.flush();
}

std::optional<std::string> Terminal::ReadLine() {
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<std::string> Terminal::Ask(const std::string& question) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << question;
        std::cout.flush();
    }
    return ReadLine();
}

} // namespace deckhand::cli
