#include "pngme/codec/png_file.hpp"

#include <algorithm>
#include <format>

#include <png.h>


namespace {

    bool is_png_signature(const uint8_t* data, size_t size) {
        if (size < pngme::PngFile::SIGNATURE.size())
            return false;

        return png_sig_cmp(data, 0, pngme::PngFile::SIGNATURE.size()) == 0;
    }

}  // namespace


namespace pngme {

    PngFile::PngFile(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    ExpChunk<PngFile> PngFile::parse(const uint8_t* data, size_t size) {
        if (!::is_png_signature(data, size)) {
            return make_chunk_err(
                ChunkErrc::invalid_signature,
                "Buffer does not start with the PNG signature"
            );
        }

        ByteReader reader{ data, size };
        reader.take(SIGNATURE.size());

        PngFile output;
        while (!reader.is_exhausted()) {
            const auto chunk_start = reader.pos();

            auto exp_chunk = Chunk::decode(reader);
            if (!exp_chunk) {
                auto err = exp_chunk.error();
                err.detail = std::format(
                    "{} (chunk #{} at offset {})",
                    err.detail,
                    output.size(),
                    chunk_start
                );
                return std::unexpected(std::move(err));
            }

            output.chunks_.push_back(std::move(*exp_chunk));
        }

        return output;
    }

    ExpChunk<PngFile> PngFile::parse(const std::vector<uint8_t>& data) {
        return PngFile::parse(data.data(), data.size());
    }

    std::vector<uint8_t> PngFile::serialize() const {
        size_t total_size = SIGNATURE.size();
        for (const auto& chunk : chunks_) {
            total_size += chunk.encoded_size();
        }

        std::vector<uint8_t> out;
        out.reserve(total_size);
        out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());
        for (const auto& chunk : chunks_) {
            chunk.encode_to(out);
        }
        return out;
    }

    const Chunk* PngFile::find_chunk(const ChunkType& type) const {
        const auto it = this->find_first(type);
        if (it == chunks_.end())
            return nullptr;
        return &(*it);
    }

    const Chunk* PngFile::find_chunk(const std::string& type) const {
        const auto exp_type = ChunkType::from_str(type);
        if (!exp_type)
            return nullptr;
        return this->find_chunk(*exp_type);
    }

    ExpChunk<const Chunk*> PngFile::require_chunk(const ChunkType& type) const {
        if (const auto chunk = this->find_chunk(type))
            return chunk;

        return make_chunk_err(
            ChunkErrc::chunk_not_found,
            std::format("No chunk of type {}", type.to_str())
        );
    }

    void PngFile::append_chunk(Chunk chunk) {
        chunks_.push_back(std::move(chunk));
    }

    ExpChunk<Chunk> PngFile::remove_first_chunk(const ChunkType& type) {
        const auto it = this->find_first(type);
        if (it == chunks_.end()) {
            return make_chunk_err(
                ChunkErrc::chunk_not_found,
                std::format("No chunk of type {} to remove", type.to_str())
            );
        }

        const auto index = static_cast<size_t>(it - chunks_.begin());
        auto removed = std::move(chunks_[index]);
        chunks_.erase(chunks_.begin() + index);
        return removed;
    }

    std::string PngFile::to_str() const {
        auto output = std::format("PNG file with {} chunks\n", chunks_.size());
        for (size_t i = 0; i < chunks_.size(); ++i) {
            output += std::format("  [{}] {}\n", i, chunks_[i].to_str());
        }
        return output;
    }

    std::vector<Chunk>::const_iterator PngFile::find_first(
        const ChunkType& type
    ) const {
        return std::find_if(
            chunks_.begin(), chunks_.end(), [&type](const Chunk& chunk) {
                return chunk.type() == type;
            }
        );
    }

}  // namespace pngme
