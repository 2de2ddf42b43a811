#pragma once

#include <cstdint>
#include <string>

#include "pngme/codec/chunk.hpp"


namespace pngme {

    /*
    IHDR chunk structure
        Width:              4 bytes
        Height:             4 bytes
        Bit depth:          1 byte
        Color type:         1 byte
        Compression method: 1 byte
        Filter method:      1 byte
        Interlace method:   1 byte
    Values are read as stored, none of them is range checked.
    */
    struct IhdrInfo {
        static constexpr size_t DATA_SIZE = 13;

        static ExpChunk<IhdrInfo> from_chunk(const Chunk& chunk);

        const char* color_type_name() const;
        std::string to_str() const;

        uint32_t width = 0;
        uint32_t height = 0;
        uint8_t bit_depth = 0;
        uint8_t color_type = 0;
        uint8_t compression_method = 0;
        uint8_t filter_method = 0;
        uint8_t interlace_method = 0;
    };

}  // namespace pngme
