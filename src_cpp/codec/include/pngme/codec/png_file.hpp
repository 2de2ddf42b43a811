#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "pngme/codec/chunk.hpp"


namespace pngme {

    /*
    The chunk stream of a PNG file: the 8-byte signature followed by
    chunks in file order. Chunk order is kept as is and never validated.
    */
    class PngFile {

    public:
        static constexpr std::array<uint8_t, 8> SIGNATURE{
            137, 80, 78, 71, 13, 10, 26, 10
        };

        PngFile() = default;
        explicit PngFile(std::vector<Chunk> chunks);

        // Fails on the first bad chunk, nothing is recovered
        static ExpChunk<PngFile> parse(const uint8_t* data, size_t size);
        static ExpChunk<PngFile> parse(const std::vector<uint8_t>& data);

        std::vector<uint8_t> serialize() const;

        // First chunk of the type or nullptr
        const Chunk* find_chunk(const ChunkType& type) const;
        const Chunk* find_chunk(const std::string& type) const;
        // Same as find_chunk but absence is a chunk_not_found error
        ExpChunk<const Chunk*> require_chunk(const ChunkType& type) const;

        void append_chunk(Chunk chunk);
        // Removes only the first match
        ExpChunk<Chunk> remove_first_chunk(const ChunkType& type);

        const std::vector<Chunk>& chunks() const { return chunks_; }
        size_t size() const { return chunks_.size(); }
        bool empty() const { return chunks_.empty(); }

        std::string to_str() const;

        bool operator==(const PngFile& rhs) const = default;

    private:
        std::vector<Chunk>::const_iterator find_first(
            const ChunkType& type
        ) const;

        std::vector<Chunk> chunks_;
    };

}  // namespace pngme
