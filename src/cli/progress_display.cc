#include <cli/progress_display.h>
#include <format>
#include <iostream>

namespace deckhand::cli {

std::string ProgressDisplay::FormatBytes(double bytes) {
    constexpr const char* units[] = {"B", "KiB", "MiB", "GiB"};
    int unit = 0;
    while (bytes >= 1024.0 && unit < 3) {
        bytes /= 1024.0;
        ++unit;
    }
    return std::format("{:.1f} {}", bytes, units[unit]);
}

std::string ProgressDisplay::Format(const core::UploadProgress& progress) {
    auto line = std::format("{:6.2f}% | {} / {} | {}/s",
                            progress.percentage,
                            FormatBytes(static_cast<double>(progress.transferred_bytes)),
                            FormatBytes(static_cast<double>(progress.total_bytes)),
                            FormatBytes(progress.speed_bps));
    if (progress.eta_seconds > 0) {
        line += std::format(" | ETA {:.0f}s", progress.eta_seconds);
    }
    if (!progress.current_file.empty()) {
        line += " | " + progress.current_file;
    }
    return line;
}

void ProgressDisplay::UpdateProgress(const core::UploadProgress& progress) {
    std::cout << "\r" << Format(progress) << "\033[K" << std::flush;
}

void ProgressDisplay::ClearProgress() {
    std::cout << "\r\033[K" << std::flush;
}

} // namespace deckhand::cli
