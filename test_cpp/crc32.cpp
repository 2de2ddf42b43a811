#include "check.hpp"
#include "pngme/codec/crc32.hpp"


namespace {

    using pngme::test::check;

    void test_known_vectors() {
        const auto check_str = pngme::test::to_bytes("123456789");
        check(
            pngme::calc_crc32(check_str.data(), check_str.size()) ==
            0xCBF43926u
        );

        check(pngme::calc_crc32(nullptr, 0) == 0);

        // CRC of an IEND chunk, the trailing bytes of every PNG file
        const auto iend = pngme::test::to_bytes("IEND");
        check(pngme::calc_crc32(iend.data(), iend.size()) == 0xAE426082u);
    }

    void test_incremental_update() {
        const auto type = pngme::test::to_bytes("RuSt");
        const auto message = pngme::test::to_bytes(
            "This is where your secret message will be!"
        );

        pngme::Crc32 crc;
        crc.update(type.data(), type.size());
        crc.update(message.data(), message.size());
        check(crc.value() == 2882656334u);

        auto joined = type;
        joined.insert(joined.end(), message.begin(), message.end());
        check(
            pngme::calc_crc32(joined.data(), joined.size()) == crc.value()
        );
    }

}  // namespace


int main() {
    ::test_known_vectors();
    ::test_incremental_update();
    return pngme::test::finish("crc32");
}
