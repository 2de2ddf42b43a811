#include "pngme/image/png_meta.hpp"

#include <cstring>
#include <format>

#include <png.h>


namespace {

    struct PngMemStream {
        const uint8_t* data = nullptr;
        size_t size = 0;
        size_t pos = 0;
        std::string error;
    };


    void png_memstream_read(png_structp png_ptr, png_bytep out, png_size_t size) {
        auto* io = static_cast<::PngMemStream*>(png_get_io_ptr(png_ptr));

        if (!io || io->size - io->pos < size) {
            png_error(png_ptr, "Read past the end of the buffer");
            return;
        }

        std::memcpy(out, io->data + io->pos, size);
        io->pos += size;
    }

    void png_record_error(png_structp png_ptr, png_const_charp msg) {
        auto* io = static_cast<::PngMemStream*>(png_get_error_ptr(png_ptr));
        if (io)
            io->error = msg ? msg : "libpng error";
        png_longjmp(png_ptr, 1);
    }

    void png_ignore_warning(png_structp, png_const_charp) {}


    class PngReader {

    public:
        PngReader() = default;

        ~PngReader() { this->destroy(); }

        PngReader(const PngReader&) = delete;
        PngReader& operator=(const PngReader&) = delete;

        std::expected<void, std::string> open(const uint8_t* data, size_t size) {
            this->destroy();

            // ---- Verify signature ----

            if (size < 8)
                return std::unexpected("Short read (signature)");

            if (png_sig_cmp(data, 0, 8))
                return std::unexpected("Not a PNG file");

            // ---- Init libpng ----

            png_ptr_ = png_create_read_struct(
                PNG_LIBPNG_VER_STRING,
                &io_,
                png_record_error,
                png_ignore_warning
            );
            if (!png_ptr_)
                return std::unexpected("png_create_read_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            // Hook the buffer into libpng
            io_.data = data;
            io_.size = size;
            io_.pos = 8;
            png_set_read_fn(png_ptr_, &io_, png_memstream_read);
            png_set_sig_bytes(png_ptr_, 8);

            // Keep private chunks instead of failing on critical ones
            png_set_keep_unknown_chunks(
                png_ptr_, PNG_HANDLE_CHUNK_ALWAYS, nullptr, 0
            );

            return {};
        }

        std::expected<void, std::string> parse_info() {
            if (setjmp(png_jmpbuf(png_ptr_))) {
                return std::unexpected(
                    std::format("Failed to parse PNG info: {}", io_.error)
                );
            }

            png_read_info(png_ptr_, info_ptr_);
            return {};
        }

        void get_metadata(pngme::PngMeta& meta) const {
            meta.width = png_get_image_width(png_ptr_, info_ptr_);
            meta.height = png_get_image_height(png_ptr_, info_ptr_);
            meta.bit_depth = png_get_bit_depth(png_ptr_, info_ptr_);
            meta.color_type = png_get_color_type(png_ptr_, info_ptr_);
            meta.interlace_type = png_get_interlace_type(png_ptr_, info_ptr_);

            png_textp text_ptr = nullptr;
            int num_text = 0;
            const auto result = png_get_text(
                png_ptr_, info_ptr_, &text_ptr, &num_text
            );

            if (result > 0) {
                meta.text.reserve((size_t)num_text);

                for (int i = 0; i < num_text; ++i) {
                    const char* key = text_ptr[i].key ? text_ptr[i].key : "";
                    const char* val = text_ptr[i].text ? text_ptr[i].text : "";

                    meta.text.push_back({ std::string(key), std::string(val) });
                }
            }

            png_unknown_chunkp unknowns = nullptr;
            const auto num_unknowns = png_get_unknown_chunks(
                png_ptr_, info_ptr_, &unknowns
            );
            for (int i = 0; i < num_unknowns; ++i) {
                // name is null terminated
                meta.unknown_chunks.emplace_back(
                    reinterpret_cast<const char*>(unknowns[i].name)
                );
            }
        }

        void destroy() {
            if (png_ptr_ || info_ptr_) {
                png_destroy_read_struct(&png_ptr_, &info_ptr_, nullptr);
                png_ptr_ = nullptr;
                info_ptr_ = nullptr;
            }
            io_ = PngMemStream{};
        }

    private:
        PngMemStream io_;
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };

}  // namespace


namespace pngme {

    std::expected<PngMeta, std::string> read_png_metadata_only(
        const uint8_t* data, size_t size
    ) {
        ::PngReader reader;

        const auto exp_open = reader.open(data, size);
        if (!exp_open)
            return std::unexpected(exp_open.error());

        // ---- Parse header & metadata ----

        const auto exp_parse_info = reader.parse_info();
        if (!exp_parse_info)
            return std::unexpected(exp_parse_info.error());

        PngMeta png_data;
        reader.get_metadata(png_data);
        return png_data;
    }

    std::string libpng_version() { return png_get_libpng_ver(nullptr); }

}  // namespace pngme
