#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "pngme/codec/error.hpp"


namespace pngme {

    /*
    Four ASCII letters naming a chunk. The case of each letter, bit 5 of
    the byte, encodes one property:
        byte 0: ancillary (lowercase) or critical (uppercase)
        byte 1: private (lowercase) or public (uppercase)
        byte 2: reserved, must be uppercase
        byte 3: safe-to-copy (lowercase) or not (uppercase)
    */
    class ChunkType {

    public:
        using Bytes = std::array<uint8_t, 4>;

        static ExpChunk<ChunkType> from_bytes(const Bytes& bytes);
        static ExpChunk<ChunkType> from_bytes(const uint8_t* bytes);
        static ExpChunk<ChunkType> from_str(const std::string& str);

        const Bytes& bytes() const { return bytes_; }
        std::string to_str() const;

        // Alphabetic bytes and a clear reserved bit
        bool is_valid() const;

        bool is_critical() const;
        bool is_ancillary() const { return !this->is_critical(); }
        bool is_public() const;
        bool is_private() const { return !this->is_public(); }
        bool is_reserved_bit_valid() const;
        bool is_safe_to_copy() const;

        bool operator==(const ChunkType& rhs) const = default;

    private:
        explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

        Bytes bytes_;
    };


    bool is_chunk_type_byte(uint8_t c);

}  // namespace pngme
