#pragma once

#include "noise_options.hpp"
#include "pixel_buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

// All encoders return an empty string on success, or the encoder's error
// message on failure. They never modify the buffer.

// PNG (8-bit RGBA, non-interlaced) into memory.
std::string encode_png(const PixelBuffer& buf, std::vector<uint8_t>& out);

// PNG to a file.
std::string export_png(const char* path, const PixelBuffer& buf);

// "data:image/png;base64,..." for pasting into CSS or HTML.
std::string png_data_url(const PixelBuffer& buf, std::string& out);

#ifdef HAVE_JXL
std::string encode_jxl(const PixelBuffer& buf, std::vector<uint8_t>& out);
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}

enum class ExportFormat {
    Png     = 0,
    Jxl     = 1,
    DataUrl = 2,  // PNG wrapped as a data URL, written to data_url, not to path
};

// Encodes an already generated buffer in the given format. JXL reports an
// error when support was not compiled in.
std::string export_buffer(const PixelBuffer& buf, ExportFormat fmt, const char* path,
                          std::string& data_url);

// "noise-<variant>-<width>x<height>.<ext>"
std::string export_file_name(const NoiseOptions& opts, const char* ext);
