#include "check.hpp"
#include "pngme/auxiliary/filesys.hpp"
#include "pngme/codec/png_file.hpp"
#include "pngme/image/png_meta.hpp"


namespace {

    using pngme::test::check;

    std::vector<uint8_t> load_fixture() {
        const auto path = pngme::test::fixture_dir() / "red_blue_2x1.png";
        auto exp_bytes = pngme::read_file(path);
        if (!exp_bytes) {
            std::println(stderr, "{}", exp_bytes.error());
            return {};
        }
        return std::move(*exp_bytes);
    }


    void test_fixture_metadata() {
        const auto bytes = load_fixture();
        check(!bytes.empty());

        const auto exp_meta = pngme::read_png_metadata_only(
            bytes.data(), bytes.size()
        );
        check(exp_meta.has_value());
        if (!exp_meta) {
            std::println(stderr, "{}", exp_meta.error());
            return;
        }

        check(exp_meta->width == 2);
        check(exp_meta->height == 1);
        check(exp_meta->bit_depth == 8);
        check(exp_meta->color_type == 6);

        const auto comment = exp_meta->find_text_chunk("Comment");
        check(comment != nullptr);
        check(comment && comment->value == "pngme fixture");
        check(exp_meta->unknown_chunks.empty());
    }

    void test_private_chunk_before_idat() {
        auto exp_png = pngme::PngFile::parse(load_fixture());
        check(exp_png.has_value());
        if (!exp_png)
            return;

        // Rebuild with a critical private chunk right after IHDR
        std::vector<pngme::Chunk> chunks = exp_png->chunks();
        const pngme::Chunk secret{ *pngme::ChunkType::from_str("RuSt"),
                                   std::string("hidden") };
        chunks.insert(chunks.begin() + 1, secret);
        const auto bytes = pngme::PngFile{ std::move(chunks) }.serialize();

        const auto exp_meta = pngme::read_png_metadata_only(
            bytes.data(), bytes.size()
        );
        check(exp_meta.has_value());
        if (!exp_meta)
            return;

        check(exp_meta->unknown_chunks.size() == 1);
        check(
            !exp_meta->unknown_chunks.empty() &&
            exp_meta->unknown_chunks[0] == "RuSt"
        );
    }

    void test_not_png() {
        const auto bytes = pngme::test::to_bytes("GIF89a, not a PNG");
        const auto exp_meta = pngme::read_png_metadata_only(
            bytes.data(), bytes.size()
        );
        check(!exp_meta);
    }

    void test_signature_only() {
        const std::vector<uint8_t> bytes(
            pngme::PngFile::SIGNATURE.begin(), pngme::PngFile::SIGNATURE.end()
        );
        const auto exp_meta = pngme::read_png_metadata_only(
            bytes.data(), bytes.size()
        );
        check(!exp_meta);
    }

}  // namespace


int main() {
    ::test_fixture_metadata();
    ::test_private_chunk_before_idat();
    ::test_not_png();
    ::test_signature_only();
    return pngme::test::finish("png_meta");
}
