#include "export.hpp"
#include "base64.hpp"

#include <png.h>
#include <csetjmp>
#include <cstdio>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

static std::string check_buffer(const PixelBuffer& buf)
{
    if (buf.empty())
        return "Pixel buffer is empty";
    if (buf.bytes.size() != static_cast<size_t>(buf.width) * buf.height * 4)
        return "Pixel buffer size does not match its dimensions";
    return {};
}

static std::string write_bytes(const char* path, const std::vector<uint8_t>& data)
{
    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(data.data(), 1, data.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != data.size() || !closed)
        return std::string("Write failed: ") + path;
    return {};
}

// ---------------------------------------------------------------------------
// PNG export
//
// PixelBuffer rows are already [R, G, B, A] bytes with no padding, which is
// exactly what PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
static void png_append(png_structp png, png_bytep data, png_size_t len)
{
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + len);
}

static void png_flush_nop(png_structp) {}

std::string encode_png(const PixelBuffer& buf, std::vector<uint8_t>& out)
{
    out.clear();
    std::string err = check_buffer(buf);
    if (!err.empty()) return err;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return "png_create_write_struct failed";

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        out.clear();
        return "PNG write error (libpng longjmp)";
    }

    png_set_write_fn(png, &out, png_append, png_flush_nop);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y)
        png_write_row(png, buf.row(y));

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return {};
}

std::string export_png(const char* path, const PixelBuffer& buf)
{
    std::vector<uint8_t> data;
    std::string err = encode_png(buf, data);
    if (!err.empty()) return err;
    return write_bytes(path, data);
}

std::string png_data_url(const PixelBuffer& buf, std::string& out)
{
    out.clear();
    std::vector<uint8_t> data;
    std::string err = encode_png(buf, data);
    if (!err.empty()) return err;
    out = "data:image/png;base64,";
    out += base64_encode(data.data(), data.size());
    return {};
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string encode_jxl(const PixelBuffer& buf, std::vector<uint8_t>& out)
{
    out.clear();
    std::string err = check_buffer(buf);
    if (!err.empty()) return err;

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 8;
    bi.alpha_exponent_bits       = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 1;
    bi.uses_original_profile     = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    // The noise is transparent by design, so alpha is always carried.
    JxlExtraChannelInfo eci;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &eci);
    eci.bits_per_sample          = 8;
    eci.exponent_bits_per_sample = 0;
    if (JxlEncoderSetExtraChannelInfo(enc, 0, &eci) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetExtraChannelInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* frame = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(frame, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    // Byte order of PixelBuffer is fixed, so endianness does not matter for UINT8.
    JxlPixelFormat fmt = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(frame, &fmt, buf.bytes.data(), buf.bytes.size())
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    out.resize(65536);
    uint8_t* next_out  = out.data();
    size_t   avail_out = out.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = static_cast<size_t>(next_out - out.data());
        out.resize(out.size() * 2);
        next_out  = out.data() + used;
        avail_out = out.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS) {
        out.clear();
        return "JxlEncoderProcessOutput failed";
    }

    out.resize(static_cast<size_t>(next_out - out.data()));
    return {};
}

std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    std::vector<uint8_t> data;
    std::string err = encode_jxl(buf, data);
    if (!err.empty()) return err;
    return write_bytes(path, data);
}
#endif  // HAVE_JXL

std::string export_buffer(const PixelBuffer& buf, ExportFormat fmt, const char* path,
                          std::string& data_url)
{
    switch (fmt) {
        case ExportFormat::Png:
            return export_png(path, buf);
        case ExportFormat::Jxl:
#ifdef HAVE_JXL
            return export_jxl(path, buf);
#else
            return "JPEG XL support was not compiled in";
#endif
        case ExportFormat::DataUrl:
            return png_data_url(buf, data_url);
    }
    return "Unknown export format";
}

std::string export_file_name(const NoiseOptions& opts, const char* ext)
{
    return std::string("noise-") + variant_name(opts.variant) + "-" +
           std::to_string(opts.width) + "x" + std::to_string(opts.height) + "." + ext;
}
