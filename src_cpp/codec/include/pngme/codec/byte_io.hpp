#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>


namespace pngme {

    // All multi-byte integers in a PNG stream are big-endian
    inline uint32_t read_be32(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) |
               (static_cast<uint32_t>(p[3]));
    }

    inline void append_be32(std::vector<uint8_t>& out, uint32_t value) {
        out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }


    // Non-owning cursor over a byte buffer, never reads past the end
    class ByteReader {

    public:
        ByteReader(const uint8_t* data, size_t size)
            : data_(data ? data : &EMPTY_BYTE), size_(data ? size : 0) {}

        bool is_exhausted() const { return pos_ >= size_; }
        size_t remaining() const { return size_ - pos_; }
        size_t pos() const { return pos_; }

        // Returns nullptr without moving if fewer than `count` bytes remain
        const uint8_t* take(size_t count) {
            if (this->remaining() < count)
                return nullptr;

            const auto out = data_ + pos_;
            pos_ += count;
            return out;
        }

    private:
        // Keeps zero-length takes non-null for an empty buffer
        static constexpr uint8_t EMPTY_BYTE = 0;

        const uint8_t* data_;
        size_t size_;
        size_t pos_ = 0;
    };

}  // namespace pngme
