#pragma once

#include <cstdint>
#include <string>

// Seeded pseudo-random stream (mulberry32 mixer over a Weyl sequence).
// The state is a single 32-bit word; every draw advances it by one Weyl step,
// so a stream is a pure function of (seed, draw index).
struct SeedStream {
    uint32_t state = 0;
};

static constexpr uint32_t SEED_WEYL_STEP        = 0x6D2B79F5u;
static constexpr uint32_t SEED_ZERO_REPLACEMENT = 0x9E3779B9u;

// Seed 0 is remapped to SEED_ZERO_REPLACEMENT.
inline SeedStream seed_stream_init(uint32_t seed)
{
    SeedStream s;
    s.state = (seed == 0) ? SEED_ZERO_REPLACEMENT : seed;
    return s;
}

uint32_t seed_stream_next_u32(SeedStream& s);

// Uniform float in [0,1) built from the top 24 bits of the next word,
// so every value is exactly representable.
inline float seed_stream_next(SeedStream& s)
{
    return static_cast<float>(seed_stream_next_u32(s) >> 8) * (1.0f / 16777216.0f);
}

// Text seeds ("seed-k3x9q1"): 31-multiplier hash, 0 maps to 1.
// Behind the seed-text option.
uint32_t string_to_seed(const std::string& text);

// Non-deterministic seed for callers that were not given one.
// Never used inside the generator itself.
uint32_t make_random_seed();
