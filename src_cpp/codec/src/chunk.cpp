#include "pngme/codec/chunk.hpp"

#include <format>
#include <limits>
#include <stdexcept>

#include "pngme/codec/crc32.hpp"


namespace {

    uint32_t calc_chunk_crc(
        const pngme::ChunkType::Bytes& type, const uint8_t* data, size_t size
    ) {
        pngme::Crc32 crc;
        crc.update(type.data(), type.size());
        crc.update(data, size);
        return crc.value();
    }

    std::unexpected<pngme::ChunkError> err_truncated(
        const char* field, size_t needed, size_t remaining
    ) {
        return pngme::make_chunk_err(
            pngme::ChunkErrc::malformed_input,
            std::format(
                "Truncated chunk {}: need {} bytes but only {} remain",
                field,
                needed,
                remaining
            )
        );
    }

}  // namespace


namespace pngme {

    Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
        : type_(type), data_(std::move(data)) {
        if (!Chunk::fits_length_field(data_.size())) {
            throw std::length_error(std::format(
                "Chunk {} data of {} bytes does not fit a 32-bit length",
                type_.to_str(),
                data_.size()
            ));
        }
    }

    Chunk::Chunk(const ChunkType& type, const std::string& data)
        : Chunk(type, std::vector<uint8_t>(data.begin(), data.end())) {}

    bool Chunk::fits_length_field(size_t data_size) {
        return data_size <= std::numeric_limits<uint32_t>::max();
    }

    ExpChunk<Chunk> Chunk::decode(ByteReader& reader) {
        const auto length_field = reader.take(4);
        if (!length_field)
            return ::err_truncated("length", 4, reader.remaining());
        const auto length = read_be32(length_field);

        const auto type_field = reader.take(4);
        if (!type_field)
            return ::err_truncated("type", 4, reader.remaining());
        auto exp_type = ChunkType::from_bytes(type_field);
        if (!exp_type)
            return std::unexpected(exp_type.error());

        const auto data_field = reader.take(length);
        if (!data_field)
            return ::err_truncated("data", length, reader.remaining());

        const auto crc_field = reader.take(4);
        if (!crc_field)
            return ::err_truncated("CRC", 4, reader.remaining());
        const auto expected_crc = read_be32(crc_field);

        const auto actual_crc = ::calc_chunk_crc(
            exp_type->bytes(), data_field, length
        );
        if (actual_crc != expected_crc) {
            return make_chunk_err(
                ChunkErrc::crc_mismatch,
                std::format(
                    "Chunk {} stores CRC {:#010x} but its content gives "
                    "{:#010x}",
                    exp_type->to_str(),
                    expected_crc,
                    actual_crc
                )
            );
        }

        return Chunk{ *exp_type,
                      std::vector<uint8_t>(data_field, data_field + length) };
    }

    ExpChunk<Chunk> Chunk::from_bytes(const uint8_t* data, size_t size) {
        ByteReader reader{ data, size };

        auto exp_chunk = Chunk::decode(reader);
        if (!exp_chunk)
            return exp_chunk;

        if (!reader.is_exhausted()) {
            return make_chunk_err(
                ChunkErrc::malformed_input,
                std::format(
                    "{} trailing bytes after chunk {}",
                    reader.remaining(),
                    exp_chunk->type().to_str()
                )
            );
        }

        return exp_chunk;
    }

    uint32_t Chunk::crc() const {
        return ::calc_chunk_crc(type_.bytes(), data_.data(), data_.size());
    }

    std::string Chunk::data_as_str() const {
        return std::string(data_.begin(), data_.end());
    }

    std::string Chunk::to_str() const {
        return std::format(
            "Chunk: type={}, length={}, crc={:#010x}",
            type_.to_str(),
            this->length(),
            this->crc()
        );
    }

    std::vector<uint8_t> Chunk::encode() const {
        std::vector<uint8_t> out;
        out.reserve(this->encoded_size());
        this->encode_to(out);
        return out;
    }

    void Chunk::encode_to(std::vector<uint8_t>& out) const {
        append_be32(out, this->length());
        out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
        out.insert(out.end(), data_.begin(), data_.end());
        append_be32(out, this->crc());
    }

}  // namespace pngme
