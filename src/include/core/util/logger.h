#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace deckhand {

// Which executable is logging. The agent runs unattended and mirrors its log to
// stdout; the hub owns the terminal, so only warnings and errors reach stderr.
enum class LogProcess {
    kAgent,
    kHub,
};

// Process-wide async logger installed as the spdlog default for its lifetime.
// Each process writes daily files "<dir>/<name>_<date>.log", the last week kept.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(LogProcess process, Level level, const std::filesystem::path& log_dir);
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    // "deckhand-agent" / "deckhand-hub"
    static std::string_view Name(LogProcess process);
    // Base path handed to the daily sink, which inserts the date before ".log"
    static std::filesystem::path FilePath(LogProcess process, const std::filesystem::path& log_dir);

    // "debug", "info", "warning" or "error"; anything else maps to info
    static Level LevelFromString(std::string_view name);
    // Debug builds log everything; the hub stays quiet unless asked
    static Level DefaultLevel(LogProcess process);

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace deckhand
