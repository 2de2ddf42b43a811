#include "check.hpp"
#include "pngme/codec/ihdr.hpp"


namespace {

    using pngme::test::check;

    void test_parse() {
        const std::vector<uint8_t> data{
            0x00, 0x00, 0x01, 0x00,  // width 256
            0x00, 0x01, 0x00, 0x02,  // height 65538
            8, 6, 0, 0, 1
        };
        const pngme::Chunk chunk{ *pngme::ChunkType::from_str("IHDR"), data };

        const auto exp_ihdr = pngme::IhdrInfo::from_chunk(chunk);
        check(exp_ihdr.has_value());
        check(exp_ihdr->width == 256);
        check(exp_ihdr->height == 65538);
        check(exp_ihdr->bit_depth == 8);
        check(exp_ihdr->color_type == 6);
        check(exp_ihdr->interlace_method == 1);
        check(
            std::string(exp_ihdr->color_type_name()) == "truecolor+alpha"
        );
        check(!exp_ihdr->to_str().empty());
    }

    void test_wrong_length() {
        const pngme::Chunk chunk{ *pngme::ChunkType::from_str("IHDR"),
                                  std::vector<uint8_t>(12) };
        const auto exp_ihdr = pngme::IhdrInfo::from_chunk(chunk);
        check(!exp_ihdr);
        check(exp_ihdr.error().code == pngme::ChunkErrc::invalid_ihdr);
    }

    void test_wrong_type() {
        const pngme::Chunk chunk{ *pngme::ChunkType::from_str("IDAT"),
                                  std::vector<uint8_t>(13) };
        const auto exp_ihdr = pngme::IhdrInfo::from_chunk(chunk);
        check(!exp_ihdr);
        check(exp_ihdr.error().code == pngme::ChunkErrc::invalid_ihdr);
    }

}  // namespace


int main() {
    ::test_parse();
    ::test_wrong_length();
    ::test_wrong_type();
    return pngme::test::finish("ihdr");
}
