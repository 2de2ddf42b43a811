#pragma once

#include <cstdint>
#include <print>
#include <source_location>
#include <string>
#include <vector>

#include "pngme/auxiliary/path.hpp"


namespace pngme::test {

    inline int& failure_count() {
        static int count = 0;
        return count;
    }

    // Failures are reported by the caller's file and line
    inline bool check(
        bool condition,
        const std::source_location loc = std::source_location::current()
    ) {
        if (!condition) {
            ++failure_count();
            std::println(
                stderr,
                "{}:{}: check failed in {}",
                loc.file_name(),
                loc.line(),
                loc.function_name()
            );
        }
        return condition;
    }

    inline int finish(const char* suite_name) {
        if (failure_count() > 0) {
            std::println("{}: {} check(s) failed", suite_name, failure_count());
            return 1;
        }
        std::println("{}: all checks passed", suite_name);
        return 0;
    }

    inline Path fixture_dir(
        const std::source_location loc = std::source_location::current()
    ) {
        const auto source_path = pngme::fromstr(loc.file_name());
        return source_path.parent_path().parent_path() / "fixtures" / "images";
    }

    inline std::vector<uint8_t> to_bytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

}  // namespace pngme::test

