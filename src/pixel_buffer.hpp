#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA8, row-major, origin top-left, no row padding.
// Byte order is fixed as [R, G, B, A] per pixel regardless of host endianness.
struct PixelBuffer {
    std::vector<uint8_t> bytes;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        bytes.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0);
    }

    void clear()
    {
        bytes.clear();
        bytes.shrink_to_fit();
        width  = 0;
        height = 0;
    }

    bool empty() const { return width <= 0 || height <= 0 || bytes.empty(); }

    size_t stride() const { return static_cast<size_t>(width) * 4; }

    uint8_t*       row(int y)       { return bytes.data() + static_cast<size_t>(y) * stride(); }
    const uint8_t* row(int y) const { return bytes.data() + static_cast<size_t>(y) * stride(); }

    const uint8_t* pixel(int x, int y) const { return row(y) + static_cast<size_t>(x) * 4; }
};
