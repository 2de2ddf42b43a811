#include "pngme/codec/error.hpp"

#include <format>


namespace pngme {

    const char* errc_name(ChunkErrc code) {
        switch (code) {
            case ChunkErrc::invalid_signature:
                return "InvalidSignature";
            case ChunkErrc::malformed_input:
                return "MalformedInput";
            case ChunkErrc::invalid_chunk_type:
                return "InvalidChunkType";
            case ChunkErrc::crc_mismatch:
                return "CrcMismatch";
            case ChunkErrc::chunk_not_found:
                return "ChunkNotFound";
            case ChunkErrc::invalid_ihdr:
                return "InvalidIhdr";
        }
        return "Unknown";
    }

    std::string ChunkError::to_str() const {
        if (detail.empty())
            return errc_name(code);
        return std::format("{}: {}", errc_name(code), detail);
    }

}  // namespace pngme
