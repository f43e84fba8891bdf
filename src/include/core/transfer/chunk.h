#pragma once

#include <core/util/binary_message.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace deckhand::core {

struct Chunk {
    std::string file_path; // relative to the upload root, '/' separated
    std::uint64_t offset = 0;
    BinaryData data;
    std::string checksum; // hex SHA-256 of data

    std::uint64_t size() const { return data.size(); }
};

// JSON header of a chunk sent as a binary frame
struct ChunkHeader {
    std::string id; // request id, echoed in upload_chunk_response
    std::string upload_id;
    std::string file_path;
    std::uint64_t offset = 0;
    std::string checksum;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ChunkHeader, id, upload_id, file_path, offset, checksum)
};

} // namespace deckhand::core
