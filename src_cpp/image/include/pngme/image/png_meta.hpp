#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>


namespace pngme {

    // Header and text metadata as seen by libpng
    struct PngMeta {
        struct TextKV {
            std::string key;
            std::string value;
        };

        const TextKV* find_text_chunk(const std::string& key) const {
            for (const auto& kv : text) {
                if (kv.key == key)
                    return &kv;
            }
            return nullptr;
        }

        uint32_t width = 0;
        uint32_t height = 0;
        int bit_depth = 0;
        int color_type = 0;
        int interlace_type = 0;
        std::vector<TextKV> text;
        // Chunks libpng has no handler for, e.g. private ones
        std::vector<std::string> unknown_chunks;
    };


    /*
    Reads chunks up to the first IDAT with libpng. Pixel data is never
    decoded, chunks after IDAT are not visited.
    */
    std::expected<PngMeta, std::string> read_png_metadata_only(
        const uint8_t* data, size_t size
    );

    std::string libpng_version();

}  // namespace pngme
