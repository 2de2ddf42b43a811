#include <fstream>

#include "check.hpp"
#include "pngme/auxiliary/tool_configs.hpp"


namespace {

    using pngme::test::check;

    void test_defaults() {
        pngme::ToolConfigs configs;
        configs.fill_default();
        check(configs.require_png_extension_);
        check(!configs.backup_before_write_);
        check(configs.data_preview_bytes_ == 32);

        const auto exp_missing = pngme::load_tool_configs(
            pngme::fs::temp_directory_path() / "pngme_no_such_config.json"
        );
        check(exp_missing.has_value());
        check(exp_missing && exp_missing->data_preview_bytes_ == 32);
    }

    void test_import_partial() {
        pngme::ToolConfigs configs;
        configs.fill_default();
        configs.import_json(
            nlohmann::json::parse(R"({"backup_before_write": true})")
        );
        check(configs.backup_before_write_);
        check(configs.require_png_extension_);
        check(configs.data_preview_bytes_ == 32);

        const auto exported = configs.export_json();
        check(exported.at("backup_before_write").get<bool>());
        check(exported.at("data_preview_bytes").get<int>() == 32);
    }

    void test_import_without_fill_default() {
        pngme::ToolConfigs configs;
        const auto json = nlohmann::json::parse(R"({"data_preview_bytes": 8})");
        configs.import_json(json);
        check(configs.require_png_extension_);
        check(!configs.backup_before_write_);
        check(configs.data_preview_bytes_ == 8);
    }

    void test_load_file() {
        const auto path = pngme::fs::temp_directory_path() /
                          "pngme_test_configs.json";

        {
            std::ofstream ofs(path);
            ofs << R"({"require_png_extension": false, "data_preview_bytes": 4})";
        }
        const auto exp_configs = pngme::load_tool_configs(path);
        check(exp_configs.has_value());
        check(exp_configs && !exp_configs->require_png_extension_);
        check(exp_configs && exp_configs->data_preview_bytes_ == 4);

        {
            std::ofstream ofs(path);
            ofs << R"({"data_preview_bytes": "many"})";
        }
        const auto exp_bad_type = pngme::load_tool_configs(path);
        check(!exp_bad_type);
        check(
            !exp_bad_type &&
            exp_bad_type.error().find("data_preview_bytes") != std::string::npos
        );

        {
            std::ofstream ofs(path);
            ofs << "{ not json";
        }
        check(!pngme::load_tool_configs(path));

        std::error_code ec;
        pngme::fs::remove(path, ec);
    }

}  // namespace


int main() {
    ::test_defaults();
    ::test_import_partial();
    ::test_import_without_fill_default();
    ::test_load_file();
    return pngme::test::finish("tool_configs");
}
