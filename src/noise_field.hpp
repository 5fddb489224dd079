#pragma once

#include "noise_options.hpp"
#include "seed_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// One sampled cell. Invisible cells are neutral background (composited with
// alpha 0) and only occur for the speck variants.
struct NoiseSample {
    float value   = 0.5f;
    bool  visible = true;
};

// Speck thresholds. Speckle fires when a draw exceeds
// SPECKLE_BASE + (1 - intensity) * SPECKLE_RANGE; dust fires when a draw is
// below intensity * DUST_DENSITY, so dust vanishes at zero intensity.
static constexpr float SPECKLE_BASE   = 0.87f;
static constexpr float SPECKLE_RANGE  = 0.08f;
static constexpr float SPECKLE_DARK   = 0.02f;
static constexpr float SPECKLE_BRIGHT = 0.98f;
static constexpr float DUST_DENSITY   = 0.04f;
static constexpr float DUST_FLOOR     = 0.55f;

// Per-variant samplers. Each consumes the stream and nothing else.
NoiseSample sample_film(SeedStream& s);
NoiseSample sample_grain(SeedStream& s);
NoiseSample sample_speckle(SeedStream& s, float intensity);
NoiseSample sample_dust(SeedStream& s, float intensity);
NoiseSample sample_line(SeedStream& s);

NoiseSample sample_cell(NoiseVariant variant, SeedStream& s, float intensity);

// Raw field of cells. A cell covers cell_w x cell_h output pixels; the last
// column/row of cells is clipped by the image edge.
struct NoiseField {
    int cols   = 0;
    int rows   = 0;
    int cell_w = 1;
    int cell_h = 1;
    std::vector<float>   values;
    std::vector<uint8_t> visible;

    size_t index(int cx, int cy) const
    {
        return static_cast<size_t>(cy) * static_cast<size_t>(cols) + static_cast<size_t>(cx);
    }

    NoiseSample at(int cx, int cy) const
    {
        const size_t i = index(cx, cy);
        return NoiseSample{values[i], visible[i] != 0};
    }
};

// ceil(w/scale) * ceil(h/scale), or height for Lines.
size_t field_sample_count(const NoiseOptions& opts);

// Samples every cell in raster order from a stream seeded with opts.seed.
// opts must already have passed sanitize_options.
void generate_field(const NoiseOptions& opts, NoiseField& field);
