#include "check.hpp"
#include "pngme/codec/chunk.hpp"


namespace {

    using pngme::test::check;

    const std::string SECRET = "This is where your secret message will be!";
    constexpr uint32_t SECRET_CRC = 2882656334u;


    std::vector<uint8_t> make_record(
        uint32_t length,
        const std::string& type,
        const std::string& data,
        uint32_t crc
    ) {
        std::vector<uint8_t> out;
        pngme::append_be32(out, length);
        out.insert(out.end(), type.begin(), type.end());
        out.insert(out.end(), data.begin(), data.end());
        pngme::append_be32(out, crc);
        return out;
    }

    pngme::Chunk make_chunk(const std::string& type, const std::string& data) {
        return pngme::Chunk{ *pngme::ChunkType::from_str(type), data };
    }


    void test_new_chunk() {
        const auto chunk = make_chunk("RuSt", SECRET);
        check(chunk.length() == 42);
        check(chunk.crc() == SECRET_CRC);
        check(chunk.type().to_str() == "RuSt");
        check(chunk.data_as_str() == SECRET);
    }

    void test_encode() {
        const auto chunk = make_chunk("RuSt", SECRET);
        const auto encoded = chunk.encode();
        check(encoded.size() == 12 + 42);
        check(encoded == make_record(42, "RuSt", SECRET, SECRET_CRC));
        check(chunk.encoded_size() == encoded.size());

        const auto empty = make_chunk("IEND", "");
        const std::vector<uint8_t> iend_bytes{
            0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82
        };
        check(empty.encode() == iend_bytes);
    }

    void test_valid_from_bytes() {
        const auto bytes = make_record(42, "RuSt", SECRET, SECRET_CRC);
        const auto exp_chunk = pngme::Chunk::from_bytes(
            bytes.data(), bytes.size()
        );
        check(exp_chunk.has_value());
        check(exp_chunk->length() == 42);
        check(exp_chunk->type().to_str() == "RuSt");
        check(exp_chunk->data_as_str() == SECRET);
        check(exp_chunk->crc() == SECRET_CRC);
        check(exp_chunk->encode() == bytes);
        check(!exp_chunk->to_str().empty());
    }

    void test_crc_mismatch() {
        const auto bytes = make_record(42, "RuSt", SECRET, SECRET_CRC - 1);
        const auto exp_chunk = pngme::Chunk::from_bytes(
            bytes.data(), bytes.size()
        );
        check(!exp_chunk);
        check(exp_chunk.error().code == pngme::ChunkErrc::crc_mismatch);
    }

    void test_single_bit_flips() {
        const auto original = make_record(42, "RuSt", SECRET, SECRET_CRC);

        // Flip every bit of the data field
        for (size_t i = 8; i < 8 + 42; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                auto bytes = original;
                bytes[i] ^= static_cast<uint8_t>(1u << bit);
                const auto exp_chunk = pngme::Chunk::from_bytes(
                    bytes.data(), bytes.size()
                );
                check(
                    !exp_chunk &&
                    exp_chunk.error().code == pngme::ChunkErrc::crc_mismatch
                );
            }
        }

        // Bit 5 of a type byte only toggles letter case, so the type is
        // still well formed and the CRC is what catches it
        for (size_t i = 4; i < 8; ++i) {
            auto bytes = original;
            bytes[i] ^= 0x20;
            const auto exp_chunk = pngme::Chunk::from_bytes(
                bytes.data(), bytes.size()
            );
            check(
                !exp_chunk &&
                exp_chunk.error().code == pngme::ChunkErrc::crc_mismatch
            );
        }
    }

    void test_invalid_type_byte() {
        const auto bytes = make_record(42, "Ru1t", SECRET, SECRET_CRC);
        const auto exp_chunk = pngme::Chunk::from_bytes(
            bytes.data(), bytes.size()
        );
        check(!exp_chunk);
        check(
            exp_chunk.error().code == pngme::ChunkErrc::invalid_chunk_type
        );
    }

    void test_truncated_fields() {
        const auto full = make_record(42, "RuSt", SECRET, SECRET_CRC);

        // Every proper prefix is missing part of some field
        for (size_t size = 0; size < full.size(); ++size) {
            const auto exp_chunk = pngme::Chunk::from_bytes(full.data(), size);
            check(
                !exp_chunk &&
                exp_chunk.error().code == pngme::ChunkErrc::malformed_input
            );
        }

        // Declared length larger than what follows
        const auto too_long = make_record(1000, "RuSt", SECRET, SECRET_CRC);
        const auto exp_chunk = pngme::Chunk::from_bytes(
            too_long.data(), too_long.size()
        );
        check(!exp_chunk);
        check(exp_chunk.error().code == pngme::ChunkErrc::malformed_input);
    }

    void test_trailing_bytes() {
        auto bytes = make_record(42, "RuSt", SECRET, SECRET_CRC);
        bytes.push_back(0);
        const auto exp_chunk = pngme::Chunk::from_bytes(
            bytes.data(), bytes.size()
        );
        check(!exp_chunk);
        check(exp_chunk.error().code == pngme::ChunkErrc::malformed_input);
    }

    void test_decode_advances_reader() {
        auto bytes = make_record(42, "RuSt", SECRET, SECRET_CRC);
        const auto second = make_chunk("ruSt", "").encode();
        bytes.insert(bytes.end(), second.begin(), second.end());

        pngme::ByteReader reader{ bytes.data(), bytes.size() };
        const auto first_chunk = pngme::Chunk::decode(reader);
        check(first_chunk.has_value());
        check(reader.pos() == 12 + 42);

        const auto second_chunk = pngme::Chunk::decode(reader);
        check(second_chunk.has_value());
        check(second_chunk->type().is_ancillary());
        check(second_chunk->data().empty());
        check(reader.is_exhausted());
    }

    void test_length_field_limit() {
        check(pngme::Chunk::fits_length_field(0));
        check(pngme::Chunk::fits_length_field(0xFFFFFFFFull));
        if constexpr (sizeof(size_t) > 4) {
            check(!pngme::Chunk::fits_length_field(0x100000000ull));
        }
    }

    void test_round_trip() {
        std::vector<uint8_t> binary(300);
        for (size_t i = 0; i < binary.size(); ++i) {
            binary[i] = static_cast<uint8_t>(i * 7);
        }
        const pngme::Chunk chunk{ *pngme::ChunkType::from_str("biNa"), binary };

        const auto encoded = chunk.encode();
        const auto decoded = pngme::Chunk::from_bytes(
            encoded.data(), encoded.size()
        );
        check(decoded.has_value());
        check(*decoded == chunk);
    }

}  // namespace


int main() {
    ::test_new_chunk();
    ::test_encode();
    ::test_valid_from_bytes();
    ::test_crc_mismatch();
    ::test_single_bit_flips();
    ::test_invalid_type_byte();
    ::test_truncated_fields();
    ::test_trailing_bytes();
    ::test_decode_advances_reader();
    ::test_length_field_limit();
    ::test_round_trip();
    return pngme::test::finish("chunk");
}
