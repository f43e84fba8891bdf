#include <algorithm>
#include <array>
#include <cctype>
#include <core/steam/artwork.h>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace deckhand::core {

namespace artwork {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kSuffixes = {{
    {"grid", "p"},
    {"banner", ""},
    {"hero", "_hero"},
    {"logo", "_logo"},
    {"icon", "_icon"},
}};

constexpr std::array<std::string_view, 4> kExtensions = {".png", ".jpg", ".jpeg", ".webp"};

void removeExisting(const std::filesystem::path& grid_dir, const std::string& stem) {
    for (auto ext : kExtensions) {
        std::error_code ec;
        std::filesystem::remove(grid_dir / (stem + std::string(ext)), ec);
    }
}

} // namespace

std::optional<std::string_view> Suffix(std::string_view artwork_type) {
    for (const auto& [type, suffix] : kSuffixes) {
        if (type == artwork_type) {
            return suffix;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> ExtensionFromContentType(std::string_view content_type) {
    if (content_type == "image/png") {
        return ".png";
    }
    if (content_type == "image/jpeg" || content_type == "image/jpg") {
        return ".jpg";
    }
    if (content_type == "image/webp") {
        return ".webp";
    }
    return std::nullopt;
}

std::filesystem::path ApplyFromData(const std::filesystem::path& grid_dir,
                                    std::uint32_t app_id,
                                    std::string_view artwork_type,
                                    std::string_view content_type,
                                    std::span<const std::uint8_t> data) {
    auto suffix = Suffix(artwork_type);
    if (!suffix) {
        throw std::invalid_argument("unknown artwork type: " + std::string(artwork_type));
    }
    auto ext = ExtensionFromContentType(content_type);
    if (!ext) {
        throw std::invalid_argument("unsupported content type: " + std::string(content_type));
    }

    std::filesystem::create_directories(grid_dir);
    auto stem = std::to_string(app_id) + std::string(*suffix);
    removeExisting(grid_dir, stem);

    auto target = grid_dir / (stem + std::string(*ext));
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open artwork file: " + target.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write artwork file: " + target.string());
    }
    return target;
}

std::filesystem::path ApplyFromFile(const std::filesystem::path& grid_dir,
                                    std::uint32_t app_id,
                                    std::string_view artwork_type,
                                    const std::filesystem::path& source) {
    auto suffix = Suffix(artwork_type);
    if (!suffix) {
        throw std::invalid_argument("unknown artwork type: " + std::string(artwork_type));
    }
    auto ext = source.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (std::find(kExtensions.begin(), kExtensions.end(), ext) == kExtensions.end()) {
        throw std::invalid_argument("unsupported image file: " + source.string());
    }

    std::filesystem::create_directories(grid_dir);
    auto stem = std::to_string(app_id) + std::string(*suffix);
    removeExisting(grid_dir, stem);

    auto target = grid_dir / (stem + ext);
    std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing);
    return target;
}

std::size_t RemoveAll(const std::filesystem::path& grid_dir, std::uint32_t app_id) {
    std::size_t removed = 0;
    for (const auto& [type, suffix] : kSuffixes) {
        auto stem = std::to_string(app_id) + std::string(suffix);
        for (auto ext : kExtensions) {
            std::error_code ec;
            if (std::filesystem::remove(grid_dir / (stem + std::string(ext)), ec)) {
                ++removed;
            }
        }
    }
    return removed;
}

} // namespace artwork

} // namespace deckhand::core
