#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pngme/auxiliary/path.hpp"


namespace pngme {

    enum class CommandKind {
        encode,
        decode,
        remove,
        print,
        info,
        verify,
        help,
        version,
    };


    struct CliArgs {
        CommandKind kind = CommandKind::help;
        std::optional<Path> config_path;

        Path png_file;
        std::string chunk_type;
        std::string message;
        std::optional<Path> output_file;

        // print options
        std::vector<std::string> type_filter;
        bool json = false;
    };


    // `args` excludes the program name
    std::expected<CliArgs, std::string> parse_args(
        const std::vector<std::string>& args
    );

    std::vector<std::string> split_type_list(const std::string& list);

    std::string usage_text();

}  // namespace pngme
