#include "compositor.hpp"

#include <cstring>

Rgba8 composite_sample(const NoiseSample& smp, const NoiseOptions& opts)
{
    const float v    = apply_contrast(apply_amplitude(opts.variant, smp.value, opts.intensity),
                                      opts.contrast);
    const float grey = v * 255.0f;
    const float ts   = opts.tint_strength;
    const float keep = 1.0f - ts;

    Rgba8 px;
    px.r = to_byte(grey * keep + static_cast<float>(opts.tint.r) * ts);
    px.g = to_byte(grey * keep + static_cast<float>(opts.tint.g) * ts);
    px.b = to_byte(grey * keep + static_cast<float>(opts.tint.b) * ts);
    px.a = smp.visible
         ? to_byte(clamp01(opts.alpha * (ALPHA_FLOOR + ALPHA_SPAN * v)) * 255.0f)
         : 0;
    return px;
}

void composite(const NoiseField& field, const NoiseOptions& opts, PixelBuffer& buf)
{
    const int W = opts.width;
    const int H = opts.height;
    buf.resize(W, H);

    // One row of cells is expanded into a scanline once, then copied to the
    // remaining rows of the block.
    std::vector<uint8_t> scan(buf.stride());

    for (int cy = 0; cy < field.rows; ++cy) {
        const int y0 = cy * field.cell_h;
        if (y0 >= H) break;
        const int y1 = std::min(y0 + field.cell_h, H);

        for (int cx = 0; cx < field.cols; ++cx) {
            const Rgba8 px = composite_sample(field.at(cx, cy), opts);
            const int   x0 = cx * field.cell_w;
            const int   x1 = std::min(x0 + field.cell_w, W);
            for (int x = x0; x < x1; ++x) {
                uint8_t* p = scan.data() + static_cast<size_t>(x) * 4;
                p[0] = px.r;
                p[1] = px.g;
                p[2] = px.b;
                p[3] = px.a;
            }
        }

        for (int y = y0; y < y1; ++y)
            std::memcpy(buf.row(y), scan.data(), scan.size());
    }
}
