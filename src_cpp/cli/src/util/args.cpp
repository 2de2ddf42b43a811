#include "util/args.hpp"

#include <format>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>


namespace {

    std::optional<pngme::CommandKind> find_command(const std::string& name) {
        using pngme::CommandKind;

        if (name == "encode")
            return CommandKind::encode;
        if (name == "decode")
            return CommandKind::decode;
        if (name == "remove")
            return CommandKind::remove;
        if (name == "print")
            return CommandKind::print;
        if (name == "info")
            return CommandKind::info;
        if (name == "verify")
            return CommandKind::verify;
        if (name == "help" || name == "--help" || name == "-h")
            return CommandKind::help;
        if (name == "version" || name == "--version")
            return CommandKind::version;

        return std::nullopt;
    }

    // Positional arguments each command takes: required, optional
    std::pair<size_t, size_t> positional_count(pngme::CommandKind kind) {
        using pngme::CommandKind;

        switch (kind) {
            case CommandKind::encode:
                return { 3, 1 };
            case CommandKind::decode:
                return { 2, 0 };
            case CommandKind::remove:
                return { 2, 1 };
            case CommandKind::print:
            case CommandKind::info:
            case CommandKind::verify:
                return { 1, 0 };
            case CommandKind::help:
            case CommandKind::version:
                return { 0, 0 };
        }
        return { 0, 0 };
    }

}  // namespace


namespace pngme {

    std::expected<CliArgs, std::string> parse_args(
        const std::vector<std::string>& args
    ) {
        CliArgs output;
        std::vector<std::string> positional;
        std::optional<CommandKind> kind;
        bool options_ended = false;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];

            // Everything after "--" is positional, e.g. a message "--json"
            if (options_ended) {
                positional.push_back(arg);
            } else if (arg == "--") {
                if (!kind)
                    return std::unexpected("'--' must follow the command");
                options_ended = true;
            } else if (arg == "--config") {
                if (i + 1 >= args.size())
                    return std::unexpected("Missing value for --config");
                output.config_path = pngme::fromstr(args[++i]);
            } else if (arg == "--types") {
                if (i + 1 >= args.size())
                    return std::unexpected("Missing value for --types");
                output.type_filter = split_type_list(args[++i]);
            } else if (arg == "--json") {
                output.json = true;
            } else if (!kind) {
                kind = ::find_command(arg);
                if (!kind)
                    return std::unexpected(
                        std::format("Unknown command '{}'", arg)
                    );
            } else {
                positional.push_back(arg);
            }
        }

        if (!kind)
            return std::unexpected("No command given");
        output.kind = *kind;

        if (output.kind != CommandKind::print) {
            if (!output.type_filter.empty() || output.json)
                return std::unexpected(
                    "--types and --json only apply to the print command"
                );
        }

        const auto [required, optional_count] = ::positional_count(
            output.kind
        );
        if (positional.size() < required)
            return std::unexpected("Too few arguments");
        if (positional.size() > required + optional_count)
            return std::unexpected("Too many arguments");

        switch (output.kind) {
            case CommandKind::encode:
                output.png_file = pngme::fromstr(positional[0]);
                output.chunk_type = positional[1];
                output.message = positional[2];
                if (positional.size() > 3)
                    output.output_file = pngme::fromstr(positional[3]);
                break;
            case CommandKind::decode:
            case CommandKind::remove:
                output.png_file = pngme::fromstr(positional[0]);
                output.chunk_type = positional[1];
                if (positional.size() > 2)
                    output.output_file = pngme::fromstr(positional[2]);
                break;
            case CommandKind::print:
            case CommandKind::info:
            case CommandKind::verify:
                output.png_file = pngme::fromstr(positional[0]);
                break;
            case CommandKind::help:
            case CommandKind::version:
                break;
        }

        return output;
    }

    std::vector<std::string> split_type_list(const std::string& list) {
        std::vector<std::string> output;

        for (auto part : absl::StrSplit(list, ',')) {
            part = absl::StripAsciiWhitespace(part);
            if (!part.empty())
                output.push_back(std::string{ part });
        }

        return output;
    }

    std::string usage_text() {
        return "Usage: pngme [--config <path>] <command> [--] ...\n"
               "\n"
               "Arguments after -- are never read as options.\n"
               "\n"
               "Commands:\n"
               "  encode <png_file> <chunk_type> <message> [<output_file>]\n"
               "  decode <png_file> <chunk_type>\n"
               "  remove <png_file> <chunk_type> [<output_file>]\n"
               "  print  <png_file> [--types T1,T2,...] [--json]\n"
               "  info   <png_file>\n"
               "  verify <png_file>\n"
               "  help\n"
               "  version\n";
    }

}  // namespace pngme
