#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pngme/codec/byte_io.hpp"
#include "pngme/codec/chunk_type.hpp"


namespace pngme {

    class Chunk {

    public:
        // length, type and crc fields
        static constexpr size_t OVERHEAD_SIZE = 12;

        // Throws std::length_error if data does not fit the length field
        Chunk(const ChunkType& type, std::vector<uint8_t> data);
        Chunk(const ChunkType& type, const std::string& data);

        static bool fits_length_field(size_t data_size);

        /*
        Decodes one chunk record starting at the reader's position and
        advances past it. On failure the reader position is unspecified.
        */
        static ExpChunk<Chunk> decode(ByteReader& reader);
        // The buffer must hold exactly one chunk record
        static ExpChunk<Chunk> from_bytes(const uint8_t* data, size_t size);

        const ChunkType& type() const { return type_; }
        const std::vector<uint8_t>& data() const { return data_; }
        uint32_t length() const { return static_cast<uint32_t>(data_.size()); }
        // Computed over type bytes followed by data bytes
        uint32_t crc() const;

        std::string data_as_str() const;
        std::string to_str() const;

        std::vector<uint8_t> encode() const;
        void encode_to(std::vector<uint8_t>& out) const;
        size_t encoded_size() const { return OVERHEAD_SIZE + data_.size(); }

        bool operator==(const Chunk& rhs) const = default;

    private:
        ChunkType type_;
        std::vector<uint8_t> data_;
    };

}  // namespace pngme
