#pragma once

#include "noise_field.hpp"
#include "noise_options.hpp"
#include "pixel_buffer.hpp"

#include <algorithm>
#include <cstdint>

// Contrast gain: contrast=1 stretches midtone spread by 1 + CONTRAST_GAIN.
static constexpr float CONTRAST_GAIN = 3.0f;

// Alpha of a visible cell is alpha * (ALPHA_FLOOR + ALPHA_SPAN * v').
static constexpr float ALPHA_FLOOR = 0.45f;
static constexpr float ALPHA_SPAN  = 0.55f;

struct Rgba8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;
};

inline float clamp01(float v)
{
    return std::max(0.0f, std::min(v, 1.0f));
}

// Round-half-up of a value already in [0, 255].
inline uint8_t to_byte(float v)
{
    return static_cast<uint8_t>(std::max(0.0f, std::min(v, 255.0f)) + 0.5f);
}

inline float apply_contrast(float v, float contrast)
{
    return clamp01(0.5f + (v - 0.5f) * (1.0f + contrast * CONTRAST_GAIN));
}

// Film, grain and lines pull their sample toward mid grey as intensity drops;
// the speck variants already spent intensity on density.
inline float apply_amplitude(NoiseVariant variant, float v, float intensity)
{
    if (variant == NoiseVariant::Speckle || variant == NoiseVariant::Dust)
        return v;
    return 0.5f + (v - 0.5f) * intensity;
}

// Final colour of one sampled cell. opts must be sanitized.
Rgba8 composite_sample(const NoiseSample& smp, const NoiseOptions& opts);

// Writes every pixel of buf (resized to opts.width x opts.height), broadcasting
// each cell's colour over its block without smoothing.
void composite(const NoiseField& field, const NoiseOptions& opts, PixelBuffer& buf);
