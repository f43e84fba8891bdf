#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace deckhand::core {

namespace artwork {

// File name suffix after the app id: grid -> "p", banner -> "", hero -> "_hero", ...
std::optional<std::string_view> Suffix(std::string_view artwork_type);

// ".png", ".jpg" or ".webp"; std::nullopt for anything else
std::optional<std::string_view> ExtensionFromContentType(std::string_view content_type);

// Writes `data` as <grid_dir>/<app_id><suffix><ext>, replacing any previous image of
// that type. Throws std::invalid_argument for an unknown type or content type.
std::filesystem::path ApplyFromData(const std::filesystem::path& grid_dir,
                                    std::uint32_t app_id,
                                    std::string_view artwork_type,
                                    std::string_view content_type,
                                    std::span<const std::uint8_t> data);

// Copies a local image file into the grid directory
std::filesystem::path ApplyFromFile(const std::filesystem::path& grid_dir,
                                    std::uint32_t app_id,
                                    std::string_view artwork_type,
                                    const std::filesystem::path& source);

// Removes every image of the entry; returns how many files were deleted
std::size_t RemoveAll(const std::filesystem::path& grid_dir, std::uint32_t app_id);

} // namespace artwork

} // namespace deckhand::core
