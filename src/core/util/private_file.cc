#include <core/util/private_file.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace deckhand::core {

void WritePrivateFile(const std::filesystem::path& file, std::string_view content) {
    namespace fs = std::filesystem;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path());
    }

    auto tmp = file;
    tmp += ".tmp";
    {
        std::ofstream create(tmp, std::ios::binary | std::ios::trunc);
        if (!create) {
            throw std::runtime_error("Failed to create " + tmp.string());
        }
    }
    // restrict before any content is written
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed to write " + tmp.string());
    }
    fs::rename(tmp, file);
}

std::filesystem::path MoveAside(const std::filesystem::path& file) {
    auto bad = file;
    bad += ".bad";
    std::filesystem::rename(file, bad);
    return bad;
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace deckhand::core
