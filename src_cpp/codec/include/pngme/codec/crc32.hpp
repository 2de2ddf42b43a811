#pragma once

#include <cstddef>
#include <cstdint>


namespace pngme {

    /*
    CRC-32 as used by PNG, ZIP and Ethernet (ISO 3309), computed with
    zlib. Can be fed in pieces, e.g. chunk type first and data after.
    */
    class Crc32 {

    public:
        Crc32();

        void update(const uint8_t* data, size_t size);
        uint32_t value() const { return crc_; }

    private:
        uint32_t crc_;
    };


    uint32_t calc_crc32(const uint8_t* data, size_t size);

}  // namespace pngme
