#pragma once

#include <expected>
#include <string>

#include "pngme/auxiliary/tool_configs.hpp"
#include "pngme/codec/png_file.hpp"
#include "util/args.hpp"


namespace pngme {

    // Text to show the user on success, an error message otherwise
    using ExpOutput = std::expected<std::string, std::string>;

    ExpOutput run_command(const CliArgs& args, const ToolConfigs& configs);

    ExpOutput encode_message(
        const Path& png_path,
        const std::string& chunk_type,
        const std::string& message,
        const Path& output_path,
        const ToolConfigs& configs
    );

    ExpOutput decode_message(
        const Path& png_path,
        const std::string& chunk_type,
        const ToolConfigs& configs
    );

    ExpOutput remove_chunk(
        const Path& png_path,
        const std::string& chunk_type,
        const Path& output_path,
        const ToolConfigs& configs
    );

    ExpOutput print_chunks(
        const Path& png_path,
        const std::vector<std::string>& type_filter,
        bool json,
        const ToolConfigs& configs
    );

    ExpOutput show_info(const Path& png_path, const ToolConfigs& configs);

    ExpOutput verify_png(const Path& png_path, const ToolConfigs& configs);

    // Printable ASCII as is, everything else as '.'
    std::string make_data_preview(const Chunk& chunk, size_t max_bytes);

}  // namespace pngme
