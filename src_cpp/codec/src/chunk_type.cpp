#include "pngme/codec/chunk_type.hpp"

#include <format>


namespace {

    constexpr uint8_t PROPERTY_BIT = 0x20;

    bool is_property_bit_set(uint8_t c) { return (c & PROPERTY_BIT) != 0; }

    std::string describe_bytes(const uint8_t* bytes) {
        return std::format(
            "[{}, {}, {}, {}]", bytes[0], bytes[1], bytes[2], bytes[3]
        );
    }

}  // namespace


namespace pngme {

    bool is_chunk_type_byte(uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

}  // namespace pngme


// ChunkType
namespace pngme {

    ExpChunk<ChunkType> ChunkType::from_bytes(const Bytes& bytes) {
        return ChunkType::from_bytes(bytes.data());
    }

    ExpChunk<ChunkType> ChunkType::from_bytes(const uint8_t* bytes) {
        for (size_t i = 0; i < 4; ++i) {
            if (!is_chunk_type_byte(bytes[i])) {
                return make_chunk_err(
                    ChunkErrc::invalid_chunk_type,
                    std::format(
                        "Byte {} of chunk type {} is not an ASCII letter",
                        i,
                        ::describe_bytes(bytes)
                    )
                );
            }
        }

        return ChunkType{ Bytes{ bytes[0], bytes[1], bytes[2], bytes[3] } };
    }

    ExpChunk<ChunkType> ChunkType::from_str(const std::string& str) {
        if (str.size() != 4) {
            return make_chunk_err(
                ChunkErrc::invalid_chunk_type,
                std::format(
                    "Chunk type must be exactly 4 characters, got \"{}\"", str
                )
            );
        }

        const auto bytes = reinterpret_cast<const uint8_t*>(str.data());
        return ChunkType::from_bytes(bytes);
    }

    std::string ChunkType::to_str() const {
        return std::string(bytes_.begin(), bytes_.end());
    }

    bool ChunkType::is_valid() const {
        for (auto c : bytes_) {
            if (!is_chunk_type_byte(c))
                return false;
        }
        return this->is_reserved_bit_valid();
    }

    bool ChunkType::is_critical() const {
        return !::is_property_bit_set(bytes_[0]);
    }

    bool ChunkType::is_public() const {
        return !::is_property_bit_set(bytes_[1]);
    }

    bool ChunkType::is_reserved_bit_valid() const {
        return !::is_property_bit_set(bytes_[2]);
    }

    bool ChunkType::is_safe_to_copy() const {
        return ::is_property_bit_set(bytes_[3]);
    }

}  // namespace pngme
