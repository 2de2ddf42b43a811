#include "command/commands.hpp"

#include <algorithm>
#include <format>

#include <nlohmann/json.hpp>

#include "pngme/auxiliary/filesys.hpp"
#include "pngme/codec/ihdr.hpp"
#include "pngme/image/png_meta.hpp"


namespace {

    constexpr const char* VERSION_STR = "0.1.0";


    pngme::ExpBytes load_png_bytes(
        const pngme::Path& path, const pngme::ToolConfigs& configs
    ) {
        if (configs.require_png_extension_ && !pngme::has_png_ext(path)) {
            return std::unexpected(std::format(
                "This program takes only PNG files: {}", pngme::tostr(path)
            ));
        }

        return pngme::read_file(path);
    }

    std::expected<pngme::PngFile, std::string> parse_png_bytes(
        const pngme::Path& path, const std::vector<uint8_t>& bytes
    ) {
        auto exp_png = pngme::PngFile::parse(bytes);
        if (!exp_png) {
            return std::unexpected(std::format(
                "Failed to parse {}: {}",
                pngme::tostr(path),
                exp_png.error().to_str()
            ));
        }

        return std::move(*exp_png);
    }

    std::expected<pngme::PngFile, std::string> load_png_file(
        const pngme::Path& path, const pngme::ToolConfigs& configs
    ) {
        const auto exp_bytes = ::load_png_bytes(path, configs);
        if (!exp_bytes)
            return std::unexpected(exp_bytes.error());

        return ::parse_png_bytes(path, *exp_bytes);
    }

    pngme::ErrStr save_png_file(
        const pngme::PngFile& png,
        const pngme::Path& src_path,
        const pngme::Path& dst_path,
        const pngme::ToolConfigs& configs
    ) {
        if (configs.backup_before_write_ && dst_path == src_path) {
            const auto backup_path = pngme::path_concat(src_path, ".bak");
            const auto exp_copy = pngme::copy_file_overwrite(
                src_path, backup_path
            );
            if (!exp_copy)
                return exp_copy;
        }

        return pngme::write_file(dst_path, png.serialize());
    }

    pngme::ExpChunk<pngme::ChunkType> parse_chunk_type(
        const std::string& str
    ) {
        auto exp_type = pngme::ChunkType::from_str(str);
        if (!exp_type)
            return exp_type;

        if (!exp_type->is_reserved_bit_valid()) {
            return pngme::make_chunk_err(
                pngme::ChunkErrc::invalid_chunk_type,
                std::format(
                    "Chunk type {} has its reserved bit set (third letter "
                    "must be uppercase)",
                    str
                )
            );
        }

        return exp_type;
    }

    std::string describe_flags(const pngme::ChunkType& type) {
        return std::format(
            "{}, {}, {}{}",
            type.is_critical() ? "critical" : "ancillary",
            type.is_public() ? "public" : "private",
            type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy",
            type.is_reserved_bit_valid() ? "" : ", reserved bit set"
        );
    }

    bool is_type_selected(
        const pngme::ChunkType& type, const std::vector<std::string>& filter
    ) {
        if (filter.empty())
            return true;

        const auto name = type.to_str();
        for (const auto& x : filter) {
            if (x == name)
                return true;
        }
        return false;
    }

}  // namespace


namespace pngme {

    ExpOutput run_command(const CliArgs& args, const ToolConfigs& configs) {
        const auto output_path = args.output_file.value_or(args.png_file);

        switch (args.kind) {
            case CommandKind::encode:
                return encode_message(
                    args.png_file,
                    args.chunk_type,
                    args.message,
                    output_path,
                    configs
                );
            case CommandKind::decode:
                return decode_message(args.png_file, args.chunk_type, configs);
            case CommandKind::remove:
                return remove_chunk(
                    args.png_file, args.chunk_type, output_path, configs
                );
            case CommandKind::print:
                return print_chunks(
                    args.png_file, args.type_filter, args.json, configs
                );
            case CommandKind::info:
                return show_info(args.png_file, configs);
            case CommandKind::verify:
                return verify_png(args.png_file, configs);
            case CommandKind::help:
                return usage_text();
            case CommandKind::version:
                return std::format(
                    "pngme {} (libpng {})", ::VERSION_STR, libpng_version()
                );
        }

        return std::unexpected("Unhandled command");
    }

    ExpOutput encode_message(
        const Path& png_path,
        const std::string& chunk_type,
        const std::string& message,
        const Path& output_path,
        const ToolConfigs& configs
    ) {
        const auto exp_type = ::parse_chunk_type(chunk_type);
        if (!exp_type)
            return std::unexpected(exp_type.error().to_str());

        auto exp_png = ::load_png_file(png_path, configs);
        if (!exp_png)
            return std::unexpected(exp_png.error());
        auto& png = *exp_png;

        png.append_chunk(Chunk{ *exp_type, message });

        const auto exp_save = ::save_png_file(
            png, png_path, output_path, configs
        );
        if (!exp_save)
            return std::unexpected(exp_save.error());

        return std::format(
            "Encoded {} bytes into chunk {} of {}",
            message.size(),
            chunk_type,
            tostr(output_path)
        );
    }

    ExpOutput decode_message(
        const Path& png_path,
        const std::string& chunk_type,
        const ToolConfigs& configs
    ) {
        const auto exp_type = ChunkType::from_str(chunk_type);
        if (!exp_type)
            return std::unexpected(exp_type.error().to_str());

        const auto exp_png = ::load_png_file(png_path, configs);
        if (!exp_png)
            return std::unexpected(exp_png.error());

        const auto exp_chunk = exp_png->require_chunk(*exp_type);
        if (!exp_chunk)
            return std::unexpected(exp_chunk.error().to_str());

        return (*exp_chunk)->data_as_str();
    }

    ExpOutput remove_chunk(
        const Path& png_path,
        const std::string& chunk_type,
        const Path& output_path,
        const ToolConfigs& configs
    ) {
        const auto exp_type = ChunkType::from_str(chunk_type);
        if (!exp_type)
            return std::unexpected(exp_type.error().to_str());

        auto exp_png = ::load_png_file(png_path, configs);
        if (!exp_png)
            return std::unexpected(exp_png.error());
        auto& png = *exp_png;

        const auto exp_removed = png.remove_first_chunk(*exp_type);
        if (!exp_removed)
            return std::unexpected(exp_removed.error().to_str());

        const auto exp_save = ::save_png_file(
            png, png_path, output_path, configs
        );
        if (!exp_save)
            return std::unexpected(exp_save.error());

        return std::format(
            "Removed chunk {} ({} bytes) from {}",
            chunk_type,
            exp_removed->length(),
            tostr(output_path)
        );
    }

    ExpOutput print_chunks(
        const Path& png_path,
        const std::vector<std::string>& type_filter,
        bool json,
        const ToolConfigs& configs
    ) {
        const auto exp_png = ::load_png_file(png_path, configs);
        if (!exp_png)
            return std::unexpected(exp_png.error());
        const auto& png = *exp_png;

        const auto preview_size = static_cast<size_t>(
            configs.data_preview_bytes_
        );

        if (json) {
            auto output = nlohmann::json::object();
            output["file"] = tostr(png_path);
            output["chunks"] = nlohmann::json::array();

            for (const auto& chunk : png.chunks()) {
                const auto& type = chunk.type();
                if (!::is_type_selected(type, type_filter))
                    continue;

                auto j_chunk = nlohmann::json::object();
                j_chunk["type"] = type.to_str();
                j_chunk["length"] = chunk.length();
                j_chunk["crc"] = chunk.crc();
                j_chunk["critical"] = type.is_critical();
                j_chunk["public"] = type.is_public();
                j_chunk["reservedBitValid"] = type.is_reserved_bit_valid();
                j_chunk["safeToCopy"] = type.is_safe_to_copy();
                j_chunk["preview"] = make_data_preview(chunk, preview_size);
                output["chunks"].push_back(j_chunk);
            }

            return output.dump(4);
        }

        auto output = std::format(
            "{}: {} chunks\n", tostr(png_path), png.size()
        );
        for (size_t i = 0; i < png.size(); ++i) {
            const auto& chunk = png.chunks()[i];
            if (!::is_type_selected(chunk.type(), type_filter))
                continue;

            output += std::format(
                "  [{}] {} length={} crc={:#010x} ({})\n",
                i,
                chunk.type().to_str(),
                chunk.length(),
                chunk.crc(),
                ::describe_flags(chunk.type())
            );

            if (preview_size > 0 && chunk.length() > 0) {
                output += std::format(
                    "      \"{}\"\n", make_data_preview(chunk, preview_size)
                );
            }
        }

        return output;
    }

    ExpOutput show_info(const Path& png_path, const ToolConfigs& configs) {
        const auto exp_bytes = ::load_png_bytes(png_path, configs);
        if (!exp_bytes)
            return std::unexpected(exp_bytes.error());

        const auto exp_png = ::parse_png_bytes(png_path, *exp_bytes);
        if (!exp_png)
            return std::unexpected(exp_png.error());

        std::string output = std::format("{}\n", tostr(png_path));

        if (const auto ihdr_chunk = exp_png->find_chunk("IHDR")) {
            const auto exp_ihdr = IhdrInfo::from_chunk(*ihdr_chunk);
            if (!exp_ihdr)
                return std::unexpected(exp_ihdr.error().to_str());
            output += std::format("  {}\n", exp_ihdr->to_str());
        } else {
            output += "  No IHDR chunk\n";
        }

        const auto exp_meta = read_png_metadata_only(
            exp_bytes->data(), exp_bytes->size()
        );
        if (!exp_meta) {
            output += std::format("  libpng: {}\n", exp_meta.error());
            return output;
        }

        const auto& meta = *exp_meta;
        output += std::format(
            "  libpng: {}x{}, bit_depth={}, color_type={}, interlace={}\n",
            meta.width,
            meta.height,
            meta.bit_depth,
            meta.color_type,
            meta.interlace_type
        );
        for (const auto& kv : meta.text) {
            output += std::format("  text: {} = {}\n", kv.key, kv.value);
        }
        for (const auto& name : meta.unknown_chunks) {
            output += std::format("  unknown chunk: {}\n", name);
        }

        return output;
    }

    ExpOutput verify_png(const Path& png_path, const ToolConfigs& configs) {
        const auto exp_png = ::load_png_file(png_path, configs);
        if (!exp_png)
            return std::unexpected(exp_png.error());

        const auto bytes = exp_png->serialize();
        const auto exp_meta = read_png_metadata_only(bytes.data(), bytes.size());
        if (!exp_meta) {
            return std::unexpected(std::format(
                "Chunk framing is valid but libpng rejects {}: {}",
                tostr(png_path),
                exp_meta.error()
            ));
        }

        return std::format(
            "{} is a valid PNG ({} chunks, {}x{})",
            tostr(png_path),
            exp_png->size(),
            exp_meta->width,
            exp_meta->height
        );
    }

    std::string make_data_preview(const Chunk& chunk, size_t max_bytes) {
        const auto& data = chunk.data();
        const auto count = std::min(max_bytes, data.size());

        std::string output;
        output.reserve(count + 3);
        for (size_t i = 0; i < count; ++i) {
            const auto c = data[i];
            output.push_back((c >= 0x20 && c < 0x7F) ? static_cast<char>(c)
                                                     : '.');
        }
        if (count < data.size())
            output += "...";

        return output;
    }

}  // namespace pngme
