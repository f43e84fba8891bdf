#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/auth/identity.h>
#include <core/util/private_file.h>
#include <spdlog/spdlog.h>

namespace deckhand::core {

std::string LoadOrCreateIdentity(const std::filesystem::path& file) {
    if (auto content = ReadTextFile(file)) {
        auto id = *content;
        while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) {
            id.pop_back();
        }
        if (!id.empty()) {
            return id;
        }
        spdlog::warn("Identity file {} is empty, generating a new id", file.string());
    }

    auto id = boost::uuids::to_string(boost::uuids::random_generator()());
    WritePrivateFile(file, id + "\n");
    spdlog::info("Generated identity {} ({})", id, file.string());
    return id;
}

} // namespace deckhand::core
