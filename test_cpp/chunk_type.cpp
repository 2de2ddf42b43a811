#include <cstdlib>

#include "check.hpp"
#include "pngme/codec/chunk_type.hpp"


namespace {

    using pngme::test::check;

    pngme::ChunkType make_type(const std::string& str) {
        auto exp_type = pngme::ChunkType::from_str(str);
        if (!exp_type) {
            std::println(stderr, "Bad test type {}", str);
            std::exit(1);
        }
        return *exp_type;
    }

    void test_from_bytes() {
        const pngme::ChunkType::Bytes expected{ 82, 117, 83, 116 };
        const auto actual = pngme::ChunkType::from_bytes(expected);
        check(actual.has_value());
        check(actual->bytes() == expected);
        check(*actual == make_type("RuSt"));
        check(actual->to_str() == "RuSt");
    }

    void test_rejects_non_letters() {
        const pngme::ChunkType::Bytes digit{ 82, 117, 49, 116 };
        const auto from_bytes = pngme::ChunkType::from_bytes(digit);
        check(!from_bytes);
        check(
            from_bytes.error().code == pngme::ChunkErrc::invalid_chunk_type
        );

        const auto from_str = pngme::ChunkType::from_str("Ru1t");
        check(!from_str);
        check(
            from_str.error().code == pngme::ChunkErrc::invalid_chunk_type
        );

        check(!pngme::ChunkType::from_str("RuS"));
        check(!pngme::ChunkType::from_str("RuStt"));
        check(!pngme::ChunkType::from_str("Ru t"));
        check(!pngme::ChunkType::from_str("Ru@t"));
        check(!pngme::ChunkType::from_str("Ru[t"));
    }

    void test_property_bits() {
        const auto rust = make_type("RuSt");
        check(rust.is_critical());
        check(!rust.is_ancillary());
        check(!rust.is_public());
        check(rust.is_private());
        check(rust.is_reserved_bit_valid());
        check(rust.is_safe_to_copy());
        check(rust.is_valid());

        check(make_type("ruSt").is_ancillary());
        check(make_type("RUSt").is_public());
        check(!make_type("RuST").is_safe_to_copy());
    }

    void test_reserved_bit() {
        const auto lower_third = make_type("Rust");
        check(!lower_third.is_reserved_bit_valid());
        check(!lower_third.is_valid());
    }

    void test_equality() {
        check(make_type("teXt") == make_type("teXt"));
        check(make_type("teXt") != make_type("tEXt"));
    }

}  // namespace


int main() {
    ::test_from_bytes();
    ::test_rejects_non_letters();
    ::test_property_bits();
    ::test_reserved_bit();
    ::test_equality();
    return pngme::test::finish("chunk_type");
}
