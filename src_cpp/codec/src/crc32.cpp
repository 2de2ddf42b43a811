#include "pngme/codec/crc32.hpp"

#include <zlib.h>


namespace pngme {

    Crc32::Crc32() : crc_(static_cast<uint32_t>(crc32(0L, Z_NULL, 0))) {}

    void Crc32::update(const uint8_t* data, size_t size) {
        if (size == 0)
            return;

        crc_ = static_cast<uint32_t>(
            crc32_z(crc_, reinterpret_cast<const Bytef*>(data), size)
        );
    }

    uint32_t calc_crc32(const uint8_t* data, size_t size) {
        Crc32 crc;
        crc.update(data, size);
        return crc.value();
    }

}  // namespace pngme
