#include "check.hpp"
#include "pngme/auxiliary/filesys.hpp"
#include "pngme/codec/png_file.hpp"


namespace {

    using pngme::test::check;

    pngme::Chunk make_chunk(const std::string& type, const std::string& data) {
        return pngme::Chunk{ *pngme::ChunkType::from_str(type), data };
    }

    std::vector<std::string> list_types(const pngme::PngFile& png) {
        std::vector<std::string> output;
        for (const auto& chunk : png.chunks()) {
            output.push_back(chunk.type().to_str());
        }
        return output;
    }

    pngme::PngFile make_sample() {
        std::vector<pngme::Chunk> chunks;
        chunks.push_back(make_chunk("IHDR", std::string(13, '\0')));
        chunks.push_back(make_chunk("teXt", "first"));
        chunks.push_back(make_chunk("teXt", "second"));
        chunks.push_back(make_chunk("IDAT", "pixels"));
        return pngme::PngFile{ std::move(chunks) };
    }

    std::vector<uint8_t> signature_bytes() {
        return std::vector<uint8_t>(
            pngme::PngFile::SIGNATURE.begin(), pngme::PngFile::SIGNATURE.end()
        );
    }


    void test_empty_container() {
        const auto sig = signature_bytes();
        const auto exp_png = pngme::PngFile::parse(sig);
        check(exp_png.has_value());
        check(exp_png->empty());
        check(exp_png->serialize() == sig);
    }

    void test_invalid_signature() {
        auto bytes = make_sample().serialize();
        bytes[1] = 'Q';
        const auto exp_png = pngme::PngFile::parse(bytes);
        check(!exp_png);
        check(
            exp_png.error().code == pngme::ChunkErrc::invalid_signature
        );

        const std::vector<uint8_t> short_buf{ 137, 80, 78, 71 };
        const auto exp_short = pngme::PngFile::parse(short_buf);
        check(!exp_short);
        check(
            exp_short.error().code == pngme::ChunkErrc::invalid_signature
        );

        const auto exp_empty = pngme::PngFile::parse(std::vector<uint8_t>{});
        check(!exp_empty);
        check(
            exp_empty.error().code == pngme::ChunkErrc::invalid_signature
        );
    }

    void test_round_trip() {
        const auto png = make_sample();
        const auto bytes = png.serialize();

        const auto exp_png = pngme::PngFile::parse(bytes);
        check(exp_png.has_value());
        check(*exp_png == png);
        check(exp_png->serialize() == bytes);
    }

    void test_lookup_and_remove() {
        auto png = make_sample();
        const auto text_type = *pngme::ChunkType::from_str("teXt");

        const auto found = png.find_chunk(text_type);
        check(found != nullptr);
        check(found && found->data_as_str() == "first");
        check(png.find_chunk("teXt") == found);
        check(png.find_chunk("tEXt") == nullptr);
        check(png.find_chunk("te1t") == nullptr);

        const auto exp_removed = png.remove_first_chunk(text_type);
        check(exp_removed.has_value());
        check(exp_removed->data_as_str() == "first");

        const std::vector<std::string> expected{ "IHDR", "teXt", "IDAT" };
        check(list_types(png) == expected);
        check(png.find_chunk(text_type)->data_as_str() == "second");
    }

    void test_remove_missing() {
        auto png = make_sample();
        const auto before = png;

        const auto exp_removed = png.remove_first_chunk(
            *pngme::ChunkType::from_str("ruSt")
        );
        check(!exp_removed);
        check(
            exp_removed.error().code == pngme::ChunkErrc::chunk_not_found
        );
        check(png == before);

        const auto exp_required = png.require_chunk(
            *pngme::ChunkType::from_str("ruSt")
        );
        check(!exp_required);
        check(
            exp_required.error().code == pngme::ChunkErrc::chunk_not_found
        );
    }

    void test_append() {
        auto png = make_sample();
        png.append_chunk(make_chunk("teXt", "third"));
        check(png.size() == 5);
        check(png.chunks().back().data_as_str() == "third");
        check(png.find_chunk("teXt")->data_as_str() == "first");
    }

    void test_malformed_chunk() {
        auto bytes = make_sample().serialize();

        // Inflate the declared length of the last chunk
        auto truncated = bytes;
        const auto last_chunk_pos = truncated.size() - (12 + 6);
        truncated[last_chunk_pos + 3] = 0xFF;
        const auto exp_truncated = pngme::PngFile::parse(truncated);
        check(!exp_truncated);
        check(
            exp_truncated.error().code == pngme::ChunkErrc::malformed_input
        );

        // A few stray bytes after the last chunk
        auto trailing = bytes;
        trailing.push_back(0);
        trailing.push_back(0);
        const auto exp_trailing = pngme::PngFile::parse(trailing);
        check(!exp_trailing);
        check(
            exp_trailing.error().code == pngme::ChunkErrc::malformed_input
        );

        // Corruption in a middle chunk fails the whole parse
        auto corrupt = bytes;
        corrupt[8 + 12 + 13 + 8] ^= 0x01;
        const auto exp_corrupt = pngme::PngFile::parse(corrupt);
        check(!exp_corrupt);
        check(exp_corrupt.error().code == pngme::ChunkErrc::crc_mismatch);
    }

    void test_fixture_file() {
        const auto path = pngme::test::fixture_dir() / "red_blue_2x1.png";
        const auto exp_bytes = pngme::read_file(path);
        check(exp_bytes.has_value());
        if (!exp_bytes)
            return;

        const auto exp_png = pngme::PngFile::parse(*exp_bytes);
        check(exp_png.has_value());
        if (!exp_png)
            return;

        const std::vector<std::string> expected{
            "IHDR", "tEXt", "IDAT", "IEND"
        };
        check(list_types(*exp_png) == expected);
        check(exp_png->serialize() == *exp_bytes);
        check(!exp_png->to_str().empty());
    }

}  // namespace


int main() {
    ::test_empty_container();
    ::test_invalid_signature();
    ::test_round_trip();
    ::test_lookup_and_remove();
    ::test_remove_missing();
    ::test_append();
    ::test_malformed_chunk();
    ::test_fixture_file();
    return pngme::test::finish("png_file");
}
