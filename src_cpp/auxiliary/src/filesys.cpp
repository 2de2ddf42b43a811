#include "pngme/auxiliary/filesys.hpp"

#include <format>
#include <fstream>


namespace pngme {

    ExpBytes read_file(const Path& path) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return std::unexpected(
                std::format("Failed to open file: {}", tostr(path))
            );

        ifs.seekg(0, std::ios::end);
        const auto file_size = ifs.tellg();
        if (file_size < 0)
            return std::unexpected(
                std::format("Failed to get file size: {}", tostr(path))
            );
        ifs.seekg(0, std::ios::beg);

        std::vector<uint8_t> out(static_cast<size_t>(file_size));
        ifs.read(
            reinterpret_cast<char*>(out.data()),
            static_cast<std::streamsize>(file_size)
        );
        if (static_cast<size_t>(ifs.gcount()) != out.size())
            return std::unexpected(
                std::format("Short read: {}", tostr(path))
            );

        return out;
    }

    ErrStr write_file(const Path& path, const void* data, size_t size) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return std::unexpected(
                std::format("Failed to open file for writing: {}", tostr(path))
            );

        ofs.write(
            reinterpret_cast<const char*>(data),
            static_cast<std::streamsize>(size)
        );
        ofs.flush();
        if (!ofs || static_cast<size_t>(ofs.tellp()) != size)
            return std::unexpected(
                std::format("Failed to write file: {}", tostr(path))
            );

        return {};
    }

    ErrStr write_file(const Path& path, const std::vector<uint8_t>& data) {
        return write_file(path, data.data(), data.size());
    }

    ErrStr copy_file_overwrite(const Path& src, const Path& dst) {
        std::error_code ec;
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec)
            return std::unexpected(std::format(
                "Failed to copy '{}' to '{}': {}",
                tostr(src),
                tostr(dst),
                ec.message()
            ));

        return {};
    }

}  // namespace pngme
