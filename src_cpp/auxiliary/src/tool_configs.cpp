#include "pngme/auxiliary/tool_configs.hpp"

#include <fstream>


namespace {

    constexpr bool DEFAULT_REQUIRE_PNG_EXT = true;
    constexpr bool DEFAULT_BACKUP_BEFORE_WRITE = false;
    constexpr int DEFAULT_DATA_PREVIEW_BYTES = 32;

    template <typename T>
    T try_get(
        const nlohmann::json& j, const char* key, const T& default_value
    ) {
        if (!j.contains(key))
            return default_value;

        try {
            return j.at(key).get<T>();
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );
        }
    }

}  // namespace


// ToolConfigs
namespace pngme {

    void ToolConfigs::fill_default() {
        require_png_extension_ = DEFAULT_REQUIRE_PNG_EXT;
        backup_before_write_ = DEFAULT_BACKUP_BEFORE_WRITE;
        data_preview_bytes_ = DEFAULT_DATA_PREVIEW_BYTES;
    }

    void ToolConfigs::import_json(const nlohmann::json& json_data) {
        if (!json_data.is_object())
            throw std::runtime_error("Config root must be a JSON object");

        require_png_extension_ = try_get(
            json_data, "require_png_extension", require_png_extension_
        );
        backup_before_write_ = try_get(
            json_data, "backup_before_write", backup_before_write_
        );
        data_preview_bytes_ = try_get(
            json_data, "data_preview_bytes", data_preview_bytes_
        );

        if (data_preview_bytes_ < 0)
            throw std::runtime_error("'data_preview_bytes' must not be negative");
    }

    nlohmann::json ToolConfigs::export_json() const {
        auto output = nlohmann::json::object();

        output["require_png_extension"] = require_png_extension_;
        output["backup_before_write"] = backup_before_write_;
        output["data_preview_bytes"] = data_preview_bytes_;

        return output;
    }

}  // namespace pngme


namespace pngme {

    ExpToolCfgs load_tool_configs(const Path& path) {
        ToolConfigs configs;
        configs.fill_default();

        std::ifstream ifs(path);
        if (!ifs)
            return configs;

        nlohmann::json json_data;

        try {
            ifs >> json_data;
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        try {
            configs.import_json(json_data);
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        return configs;
    }

    ExpToolCfgs load_tool_configs() {
        return load_tool_configs("./pngme_configs.json");
    }

}  // namespace pngme
