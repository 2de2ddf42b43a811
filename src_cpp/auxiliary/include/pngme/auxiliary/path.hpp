#pragma once

#include <filesystem>
#include <string>


namespace pngme {

    namespace fs = std::filesystem;

    using Path = std::filesystem::path;


    std::string tostr(const Path& path);

    Path fromstr(const std::string& str);

    Path path_concat(const Path& base, const std::string& suffix);

    // Case-insensitive, ".png" and ".PNG" both match
    bool has_png_ext(const Path& path);

}  // namespace pngme
