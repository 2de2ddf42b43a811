#include "pngme/codec/ihdr.hpp"

#include <format>


namespace pngme {

    ExpChunk<IhdrInfo> IhdrInfo::from_chunk(const Chunk& chunk) {
        if (chunk.type().to_str() != "IHDR") {
            return make_chunk_err(
                ChunkErrc::invalid_ihdr,
                std::format("Expected IHDR chunk, got {}", chunk.type().to_str())
            );
        }

        const auto& data = chunk.data();
        if (data.size() != DATA_SIZE) {
            return make_chunk_err(
                ChunkErrc::invalid_ihdr,
                std::format(
                    "IHDR chunk must be exactly {} bytes long, got {}",
                    DATA_SIZE,
                    data.size()
                )
            );
        }

        IhdrInfo output;
        output.width = read_be32(data.data());
        output.height = read_be32(data.data() + 4);
        output.bit_depth = data[8];
        output.color_type = data[9];
        output.compression_method = data[10];
        output.filter_method = data[11];
        output.interlace_method = data[12];
        return output;
    }

    const char* IhdrInfo::color_type_name() const {
        switch (color_type) {
            case 0:
                return "grayscale";
            case 2:
                return "truecolor";
            case 3:
                return "indexed";
            case 4:
                return "grayscale+alpha";
            case 6:
                return "truecolor+alpha";
            default:
                return "unknown";
        }
    }

    std::string IhdrInfo::to_str() const {
        return std::format(
            "IHDR: {}x{}, bit_depth={}, color_type={} ({}), "
            "compression_method={}, filter_method={}, interlace_method={}",
            width,
            height,
            bit_depth,
            color_type,
            this->color_type_name(),
            compression_method,
            filter_method,
            interlace_method
        );
    }

}  // namespace pngme
