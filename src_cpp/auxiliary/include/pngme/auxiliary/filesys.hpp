#pragma once

#include <cstdint>
#include <expected>
#include <vector>

#include "pngme/auxiliary/err_str.hpp"
#include "pngme/auxiliary/path.hpp"


namespace pngme {

    using ExpBytes = std::expected<std::vector<uint8_t>, std::string>;

    // Reads the whole file, an empty file gives an empty buffer
    ExpBytes read_file(const Path& path);

    ErrStr write_file(const Path& path, const void* data, size_t size);
    ErrStr write_file(const Path& path, const std::vector<uint8_t>& data);

    ErrStr copy_file_overwrite(const Path& src, const Path& dst);

}  // namespace pngme
