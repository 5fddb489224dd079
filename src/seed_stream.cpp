#include "seed_stream.hpp"

#include <random>

uint32_t seed_stream_next_u32(SeedStream& s)
{
    s.state += SEED_WEYL_STEP;
    uint32_t r = (s.state ^ (s.state >> 15)) * (s.state | 1u);
    r ^= r + (r ^ (r >> 7)) * (r | 61u);
    return r ^ (r >> 14);
}

uint32_t string_to_seed(const std::string& text)
{
    uint32_t hash = 0;
    for (unsigned char c : text)
        hash = (hash << 5) - hash + c;
    return hash ? hash : 1u;
}

uint32_t make_random_seed()
{
    std::random_device rd;
    return static_cast<uint32_t>(rd());
}
