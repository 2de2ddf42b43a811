#pragma once

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "pngme/auxiliary/path.hpp"


namespace pngme {

    class ToolConfigs {

    public:
        void fill_default();

        // Keys absent from the json keep their default values
        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Refuse files that do not end with ".png"
        bool require_png_extension_ = true;
        // Copy the input to "<file>.bak" before overwriting it in place
        bool backup_before_write_ = false;
        // How many data bytes "print" shows per chunk
        int data_preview_bytes_ = 32;
    };


    using ExpToolCfgs = std::expected<ToolConfigs, std::string>;

    // Missing file is not an error, defaults are returned
    ExpToolCfgs load_tool_configs(const Path& path);
    ExpToolCfgs load_tool_configs();

}  // namespace pngme
