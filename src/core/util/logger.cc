#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace deckhand {

namespace {

constexpr std::size_t kQueueSize = 8192;
constexpr std::uint16_t kKeptFiles = 7;

void stamp(std::FILE* file, const char* what, const spdlog::filename_t& filename) {
    if (file) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::fprintf(file, "[%s: %s | %s]\n", what, filename.c_str(), std::ctime(&now));
    }
}

} // namespace

Logger::Logger(LogProcess process, Level level, const std::filesystem::path& log_dir) {
    std::filesystem::create_directories(log_dir);

    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* file) {
        stamp(file, "Log Start", filename);
    };
    handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* file) {
        stamp(file, "Log End", filename);
    };
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        FilePath(process, log_dir).string(), 0, 0, false, kKeptFiles, handlers)};

    if (process == LogProcess::kAgent) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[0m%^[%l]%$ %v");
#ifdef DECKHAND_RELEASE
        console->set_level(Level::warn);
#endif
        sinks.push_back(std::move(console));
    } else {
        // stdout carries command output and the progress bar
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%^%l%$: %v");
        console->set_level(Level::warn);
        sinks.push_back(std::move(console));
    }

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(kQueueSize, 1);
    logger_ = std::make_shared<spdlog::async_logger>(std::string(Name(process)),
                                                     sinks.begin(),
                                                     sinks.end(),
                                                     thread_pool_,
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(level);
    logger_->set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str());
    });
    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    logger_->flush();
    spdlog::shutdown();
}

std::string_view Logger::Name(LogProcess process) {
    return process == LogProcess::kAgent ? "deckhand-agent" : "deckhand-hub";
}

std::filesystem::path Logger::FilePath(LogProcess process, const std::filesystem::path& log_dir) {
    return log_dir / (process == LogProcess::kAgent ? "agent.log" : "hub.log");
}

Logger::Level Logger::LevelFromString(std::string_view name) {
    if (name == "debug") {
        return Level::debug;
    }
    if (name == "warning" || name == "warn") {
        return Level::warn;
    }
    if (name == "error") {
        return Level::err;
    }
    return Level::info;
}

Logger::Level Logger::DefaultLevel([[maybe_unused]] LogProcess process) {
#ifdef DECKHAND_DEBUG
    return Level::debug;
#else
    return process == LogProcess::kAgent ? Level::info : Level::warn;
#endif
}

} // namespace deckhand
