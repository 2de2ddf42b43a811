#include <print>
#include <string>
#include <vector>

#include "command/commands.hpp"
#include "pngme/auxiliary/tool_configs.hpp"
#include "util/args.hpp"


int main(int argc, char* argv[]) {
    const std::vector<std::string> raw_args(argv + 1, argv + argc);

    const auto exp_args = pngme::parse_args(raw_args);
    if (!exp_args) {
        std::println(stderr, "Error: {}", exp_args.error());
        std::print(stderr, "{}", pngme::usage_text());
        return 1;
    }
    const auto& args = *exp_args;

    const auto exp_configs = args.config_path
                                 ? pngme::load_tool_configs(*args.config_path)
                                 : pngme::load_tool_configs();
    if (!exp_configs) {
        std::println(
            stderr, "Cannot load tool configs: {}", exp_configs.error()
        );
        return 1;
    }

    const auto exp_output = pngme::run_command(args, *exp_configs);
    if (!exp_output) {
        std::println(stderr, "An error occurred: {}", exp_output.error());
        return 1;
    }

    std::print("{}", *exp_output);
    if (!exp_output->empty() && exp_output->back() != '\n')
        std::println("");

    return 0;
}
