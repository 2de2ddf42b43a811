#pragma once

#include <expected>
#include <string>
#include <utility>


namespace pngme {

    enum class ChunkErrc {
        invalid_signature,
        malformed_input,
        invalid_chunk_type,
        crc_mismatch,
        chunk_not_found,
        invalid_ihdr,
    };

    const char* errc_name(ChunkErrc code);


    struct ChunkError {
        std::string to_str() const;

        ChunkErrc code;
        std::string detail;
    };


    template <typename T>
    using ExpChunk = std::expected<T, ChunkError>;

    inline std::unexpected<ChunkError> make_chunk_err(
        ChunkErrc code, std::string detail
    ) {
        return std::unexpected(ChunkError{ code, std::move(detail) });
    }

}  // namespace pngme
