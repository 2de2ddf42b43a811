#include "check.hpp"
#include "command/commands.hpp"
#include "pngme/auxiliary/filesys.hpp"
#include "util/args.hpp"


namespace {

    using pngme::test::check;

    pngme::ToolConfigs default_configs() {
        pngme::ToolConfigs configs;
        configs.fill_default();
        return configs;
    }

    // Fresh copy of the fixture inside the temp directory
    pngme::Path make_work_copy(const std::string& name) {
        const auto src = pngme::test::fixture_dir() / "red_blue_2x1.png";
        const auto dst = pngme::fs::temp_directory_path() / name;
        const auto exp_copy = pngme::copy_file_overwrite(src, dst);
        if (!exp_copy)
            std::println(stderr, "{}", exp_copy.error());
        return dst;
    }


    void test_parse_args() {
        const auto exp_encode = pngme::parse_args(
            { "encode", "a.png", "ruSt", "hello world", "b.png" }
        );
        check(exp_encode.has_value());
        check(exp_encode->kind == pngme::CommandKind::encode);
        check(exp_encode->chunk_type == "ruSt");
        check(exp_encode->message == "hello world");
        check(exp_encode->output_file == pngme::fromstr("b.png"));

        const auto exp_print = pngme::parse_args({ "--config",
                                                    "c.json",
                                                    "print",
                                                    "a.png",
                                                    "--types",
                                                    " IHDR, teXt ,",
                                                    "--json" });
        check(exp_print.has_value());
        check(exp_print->kind == pngme::CommandKind::print);
        check(exp_print->json);
        check(exp_print->config_path == pngme::fromstr("c.json"));
        const std::vector<std::string> types{ "IHDR", "teXt" };
        check(exp_print->type_filter == types);

        check(!pngme::parse_args({}));
        check(!pngme::parse_args({ "explode", "a.png" }));
        check(!pngme::parse_args({ "decode", "a.png" }));
        check(!pngme::parse_args({ "decode", "a.png", "ruSt", "x" }));
        check(
            !pngme::parse_args({ "decode", "a.png", "ruSt", "--json" })
        );
        check(!pngme::parse_args({ "print", "a.png", "--types" }));
        check(pngme::parse_args({ "--help" }).has_value());

        const auto exp_dashes = pngme::parse_args(
            { "encode", "a.png", "ruSt", "--", "--json" }
        );
        check(exp_dashes.has_value());
        check(exp_dashes && exp_dashes->message == "--json");
        check(exp_dashes && !exp_dashes->json);
        check(!pngme::parse_args({ "--", "encode", "a.png" }));
    }

    void test_encode_decode_remove() {
        const auto configs = default_configs();
        const auto path = make_work_copy("pngme_test_commands.png");
        const auto original = pngme::read_file(path);
        check(original.has_value());

        const auto exp_encode = pngme::encode_message(
            path, "ruSt", "secret message", path, configs
        );
        check(exp_encode.has_value());

        const auto exp_decode = pngme::decode_message(path, "ruSt", configs);
        check(exp_decode.has_value());
        check(exp_decode && *exp_decode == "secret message");

        const auto exp_print = pngme::print_chunks(path, {}, false, configs);
        check(exp_print.has_value());
        check(
            exp_print && exp_print->find("ruSt") != std::string::npos
        );

        const auto exp_json = pngme::print_chunks(
            path, { "ruSt" }, true, configs
        );
        check(exp_json.has_value());
        if (exp_json) {
            const auto j = nlohmann::json::parse(*exp_json);
            check(j.at("chunks").size() == 1);
            check(j.at("chunks")[0].at("type") == "ruSt");
            check(j.at("chunks")[0].at("length") == 14);
            check(j.at("chunks")[0].at("critical") == false);
        }

        const auto exp_verify = pngme::verify_png(path, configs);
        check(exp_verify.has_value());

        const auto exp_remove = pngme::remove_chunk(
            path, "ruSt", path, configs
        );
        check(exp_remove.has_value());

        const auto restored = pngme::read_file(path);
        check(restored.has_value());
        check(original && restored && *original == *restored);

        const auto exp_missing = pngme::decode_message(path, "ruSt", configs);
        check(!exp_missing);
        check(!pngme::remove_chunk(path, "ruSt", path, configs));

        std::error_code ec;
        pngme::fs::remove(path, ec);
    }

    void test_output_file_and_backup() {
        auto configs = default_configs();
        configs.backup_before_write_ = true;

        const auto path = make_work_copy("pngme_test_backup.png");
        const auto out_path = pngme::fs::temp_directory_path() /
                              "pngme_test_backup_out.png";
        const auto backup_path = pngme::path_concat(path, ".bak");
        std::error_code ec;
        pngme::fs::remove(backup_path, ec);

        // Writing elsewhere leaves the input alone and makes no backup
        const auto original = pngme::read_file(path);
        check(
            pngme::encode_message(path, "ruSt", "x", out_path, configs)
                .has_value()
        );
        check(pngme::read_file(path) == original);
        check(!pngme::fs::exists(backup_path));
        check(pngme::decode_message(out_path, "ruSt", configs) == "x");

        // Writing in place keeps the previous content as .bak
        check(
            pngme::encode_message(path, "ruSt", "y", path, configs).has_value()
        );
        check(pngme::fs::exists(backup_path));
        check(pngme::read_file(backup_path) == original);

        pngme::fs::remove(path, ec);
        pngme::fs::remove(out_path, ec);
        pngme::fs::remove(backup_path, ec);
    }

    void test_rejections() {
        const auto configs = default_configs();
        const auto path = make_work_copy("pngme_test_reject.png");

        // Reserved bit set, digits, wrong length
        check(!pngme::encode_message(path, "Rust", "m", path, configs));
        check(!pngme::encode_message(path, "Ru1t", "m", path, configs));
        check(!pngme::encode_message(path, "RuStX", "m", path, configs));

        const auto txt_path = pngme::fs::temp_directory_path() /
                              "pngme_test_reject.txt";
        pngme::fs::copy_file(
            path, txt_path, pngme::fs::copy_options::overwrite_existing
        );
        check(!pngme::verify_png(txt_path, configs));

        auto relaxed = configs;
        relaxed.require_png_extension_ = false;
        check(pngme::verify_png(txt_path, relaxed).has_value());

        // Not a PNG at all
        const auto junk = pngme::test::to_bytes("just some text");
        check(pngme::write_file(txt_path, junk).has_value());
        check(!pngme::verify_png(txt_path, relaxed));

        std::error_code ec;
        pngme::fs::remove(path, ec);
        pngme::fs::remove(txt_path, ec);
    }

    void test_info_and_preview() {
        const auto configs = default_configs();
        const auto path = make_work_copy("pngme_test_info.png");

        const auto exp_info = pngme::show_info(path, configs);
        check(exp_info.has_value());
        if (exp_info) {
            check(exp_info->find("2x1") != std::string::npos);
            check(exp_info->find("pngme fixture") != std::string::npos);
        }

        const pngme::Chunk chunk{ *pngme::ChunkType::from_str("ruSt"),
                                  std::vector<uint8_t>{ 'a', 0, 'b', 'c' } };
        check(pngme::make_data_preview(chunk, 10) == "a.bc");
        check(pngme::make_data_preview(chunk, 2) == "a....");

        std::error_code ec;
        pngme::fs::remove(path, ec);
    }

}  // namespace


int main() {
    ::test_parse_args();
    ::test_encode_decode_remove();
    ::test_output_file_and_backup();
    ::test_rejections();
    ::test_info_and_preview();
    return pngme::test::finish("commands");
}
