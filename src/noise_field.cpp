#include "noise_field.hpp"

// ---------------------------------------------------------------------------
// Variant samplers
// ---------------------------------------------------------------------------
NoiseSample sample_film(SeedStream& s)
{
    return NoiseSample{seed_stream_next(s), true};
}

NoiseSample sample_grain(SeedStream& s)
{
    const float a = seed_stream_next(s);
    const float b = seed_stream_next(s);
    const float c = seed_stream_next(s);
    return NoiseSample{(a + b + c) / 3.0f, true};
}

NoiseSample sample_speckle(SeedStream& s, float intensity)
{
    const float threshold = SPECKLE_BASE + (1.0f - intensity) * SPECKLE_RANGE;
    if (seed_stream_next(s) <= threshold)
        return NoiseSample{0.5f, false};
    const bool dark = seed_stream_next(s) < 0.5f;
    return NoiseSample{dark ? SPECKLE_DARK : SPECKLE_BRIGHT, true};
}

NoiseSample sample_dust(SeedStream& s, float intensity)
{
    if (seed_stream_next(s) >= intensity * DUST_DENSITY)
        return NoiseSample{0.5f, false};
    return NoiseSample{DUST_FLOOR + (1.0f - DUST_FLOOR) * seed_stream_next(s), true};
}

NoiseSample sample_line(SeedStream& s)
{
    return NoiseSample{seed_stream_next(s), true};
}

NoiseSample sample_cell(NoiseVariant variant, SeedStream& s, float intensity)
{
    switch (variant) {
        case NoiseVariant::Film:    return sample_film(s);
        case NoiseVariant::Grain:   return sample_grain(s);
        case NoiseVariant::Speckle: return sample_speckle(s, intensity);
        case NoiseVariant::Dust:    return sample_dust(s, intensity);
        case NoiseVariant::Lines:   return sample_line(s);
    }
    return sample_film(s);
}

// ---------------------------------------------------------------------------
// Field layout
// ---------------------------------------------------------------------------
static void field_layout(const NoiseOptions& opts, NoiseField& f)
{
    if (opts.variant == NoiseVariant::Lines) {
        f.cols   = 1;
        f.rows   = opts.height;
        f.cell_w = opts.width;
        f.cell_h = 1;
    } else {
        f.cols   = (opts.width  + opts.scale - 1) / opts.scale;
        f.rows   = (opts.height + opts.scale - 1) / opts.scale;
        f.cell_w = opts.scale;
        f.cell_h = opts.scale;
    }
}

size_t field_sample_count(const NoiseOptions& opts)
{
    NoiseField f;
    field_layout(opts, f);
    return static_cast<size_t>(f.cols) * static_cast<size_t>(f.rows);
}

void generate_field(const NoiseOptions& opts, NoiseField& field)
{
    field_layout(opts, field);
    const size_t n = static_cast<size_t>(field.cols) * static_cast<size_t>(field.rows);
    field.values.assign(n, 0.5f);
    field.visible.assign(n, 0);

    SeedStream stream = seed_stream_init(opts.seed);
    for (size_t i = 0; i < n; ++i) {
        const NoiseSample smp = sample_cell(opts.variant, stream, opts.intensity);
        field.values[i]  = smp.value;
        field.visible[i] = smp.visible ? 1 : 0;
    }
}
