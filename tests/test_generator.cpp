// tests/test_generator.cpp
#include <doctest/doctest.h>

#include "generator.hpp"
#include "seed_stream.hpp"

#include <cmath>
#include <set>
#include <tuple>
#include <vector>

namespace {

NoiseOptions base_opts(NoiseVariant v)
{
    NoiseOptions o;
    o.width     = 96;
    o.height    = 64;
    o.variant   = v;
    o.intensity = 0.7f;
    o.alpha     = 0.8f;
    o.contrast  = 0.3f;
    o.scale     = 1;
    o.seed      = 777;
    return o;
}

PixelBuffer must_generate(const NoiseOptions& o)
{
    PixelBuffer buf;
    const NoiseStatus st = generate_noise(o, buf);
    REQUIRE(st.ok());
    return buf;
}

double channel_variance(const PixelBuffer& buf, int channel)
{
    const size_t n = buf.bytes.size() / 4;
    double mean = 0.0;
    for (size_t i = 0; i < n; ++i) mean += buf.bytes[i * 4 + channel];
    mean /= static_cast<double>(n);
    double var = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = buf.bytes[i * 4 + channel] - mean;
        var += d * d;
    }
    return var / static_cast<double>(n);
}

const NoiseVariant ALL_VARIANTS[] = {
    NoiseVariant::Film, NoiseVariant::Grain, NoiseVariant::Speckle,
    NoiseVariant::Dust, NoiseVariant::Lines,
};

} // namespace

TEST_CASE("generate_noise: identical options give identical bytes for every variant") {
    for (NoiseVariant v : ALL_VARIANTS) {
        CAPTURE(variant_name(v));
        NoiseOptions o = base_opts(v);
        o.scale = 3;
        const PixelBuffer a = must_generate(o);
        const PixelBuffer b = must_generate(o);
        CHECK(a.bytes == b.bytes);
    }
}

TEST_CASE("generate_noise: different seeds give different buffers") {
    for (NoiseVariant v : ALL_VARIANTS) {
        CAPTURE(variant_name(v));
        std::set<std::vector<uint8_t>> seen;
        for (uint32_t seed = 1; seed <= 10; ++seed) {
            NoiseOptions o = base_opts(v);
            o.seed = seed;
            seen.insert(must_generate(o).bytes);
        }
        CHECK(seen.size() == 10u);
    }
}

TEST_CASE("generate_noise: seed 0 behaves like the canonical replacement seed") {
    NoiseOptions a = base_opts(NoiseVariant::Film);
    NoiseOptions b = a;
    a.seed = 0;
    b.seed = SEED_ZERO_REPLACEMENT;
    CHECK(must_generate(a).bytes == must_generate(b).bytes);
}

TEST_CASE("generate_noise: buffer length is width*height*4") {
    NoiseOptions o = base_opts(NoiseVariant::Film);
    o.width  = 512;
    o.height = 512;
    const PixelBuffer buf = must_generate(o);
    CHECK(buf.width == 512);
    CHECK(buf.height == 512);
    CHECK(buf.bytes.size() == 1048576u);
}

TEST_CASE("generate_noise: dimensions and scale are clamped, not rejected") {
    NoiseOptions o = base_opts(NoiseVariant::Grain);
    o.width  = 10;
    o.height = 99999;
    PixelBuffer buf = must_generate(o);
    CHECK(buf.width == MIN_DIMENSION);
    CHECK(buf.height == MAX_DIMENSION);
    CHECK(buf.bytes.size() == static_cast<size_t>(MIN_DIMENSION) * MAX_DIMENSION * 4);

    NoiseOptions s0 = base_opts(NoiseVariant::Film);
    NoiseOptions s1 = s0;
    s0.scale = 0;
    s1.scale = 1;
    CHECK(must_generate(s0).bytes == must_generate(s1).bytes);

    NoiseOptions hi = base_opts(NoiseVariant::Film);
    NoiseOptions one = hi;
    hi.intensity  = 5.0f;
    one.intensity = 1.0f;
    CHECK(must_generate(hi).bytes == must_generate(one).bytes);
}

TEST_CASE("generate_noise: scale 4 makes every 4x4 block uniform") {
    for (NoiseVariant v : {NoiseVariant::Film, NoiseVariant::Grain, NoiseVariant::Speckle}) {
        CAPTURE(variant_name(v));
        NoiseOptions o = base_opts(v);
        o.width  = 70;   // not a multiple of 4: the last blocks are clipped
        o.height = 50;
        o.scale  = 4;
        const PixelBuffer buf = must_generate(o);
        int mismatches = 0;
        for (int y = 0; y < buf.height; ++y) {
            for (int x = 0; x < buf.width; ++x) {
                const uint8_t* p = buf.pixel(x, y);
                const uint8_t* q = buf.pixel(x - x % 4, y - y % 4);
                for (int c = 0; c < 4; ++c)
                    if (p[c] != q[c]) ++mismatches;
            }
        }
        CHECK(mismatches == 0);
    }
}

TEST_CASE("generate_noise: scale 1 lets neighbouring pixels differ") {
    const PixelBuffer buf = must_generate(base_opts(NoiseVariant::Film));
    int differing = 0;
    for (int x = 1; x < buf.width; ++x)
        if (buf.pixel(x, 0)[0] != buf.pixel(x - 1, 0)[0]) ++differing;
    CHECK(differing > buf.width / 2);
}

TEST_CASE("generate_noise: tint strength 0 is grey, 1 is the exact tint") {
    for (NoiseVariant v : ALL_VARIANTS) {
        CAPTURE(variant_name(v));
        NoiseOptions o = base_opts(v);
        o.tint = Rgb8{0x33, 0x66, 0xcc};

        o.tint_strength = 0.0f;
        const PixelBuffer grey = must_generate(o);
        bool all_grey = true;
        for (size_t i = 0; i < grey.bytes.size(); i += 4)
            all_grey = all_grey && grey.bytes[i] == grey.bytes[i + 1]
                                && grey.bytes[i + 1] == grey.bytes[i + 2];
        CHECK(all_grey);

        o.tint_strength = 1.0f;
        const PixelBuffer tinted = must_generate(o);
        bool all_tint = true;
        for (size_t i = 0; i < tinted.bytes.size(); i += 4)
            all_tint = all_tint && tinted.bytes[i] == 0x33 && tinted.bytes[i + 1] == 0x66
                                && tinted.bytes[i + 2] == 0xcc;
        CHECK(all_tint);
    }
}

TEST_CASE("generate_noise: dust at zero intensity is fully transparent") {
    NoiseOptions o = base_opts(NoiseVariant::Dust);
    o.intensity = 0.0f;
    o.alpha     = 1.0f;
    const PixelBuffer buf = must_generate(o);
    bool all_clear = true;
    for (size_t i = 3; i < buf.bytes.size(); i += 4)
        all_clear = all_clear && buf.bytes[i] == 0;
    CHECK(all_clear);
}

TEST_CASE("generate_noise: sparse variants leave the background transparent") {
    for (NoiseVariant v : {NoiseVariant::Speckle, NoiseVariant::Dust}) {
        CAPTURE(variant_name(v));
        NoiseOptions o = base_opts(v);
        o.intensity = 1.0f;
        o.alpha     = 1.0f;
        const PixelBuffer buf = must_generate(o);
        size_t clear = 0, opaque = 0;
        for (size_t i = 3; i < buf.bytes.size(); i += 4)
            (buf.bytes[i] == 0 ? clear : opaque) += 1;
        CHECK(clear > opaque);
        CHECK(opaque > 0u);
    }
}

TEST_CASE("generate_noise: raising contrast never lowers grey variance") {
    for (NoiseVariant v : ALL_VARIANTS) {
        CAPTURE(variant_name(v));
        double prev = -1.0;
        for (float c : {0.0f, 0.25f, 0.5f, 0.75f, 1.0f}) {
            NoiseOptions o = base_opts(v);
            o.width    = 128;
            o.height   = 128;
            o.contrast = c;
            const double var = channel_variance(must_generate(o), 0);
            CHECK(var >= prev);
            prev = var;
        }
    }
}

TEST_CASE("generate_noise: 64x64 scan lines are uniform per row and vary between rows") {
    NoiseOptions o;
    o.width         = 64;
    o.height        = 64;
    o.variant       = NoiseVariant::Lines;
    o.scale         = 1;
    o.seed          = 42;
    o.intensity     = 1.0f;
    o.alpha         = 1.0f;
    o.contrast      = 0.0f;
    o.tint          = Rgb8{255, 255, 255};
    o.tint_strength = 0.0f;

    const PixelBuffer buf = must_generate(o);
    REQUIRE(buf.bytes.size() == 64u * 64u * 4u);

    std::set<std::tuple<int, int, int, int>> rows;
    for (int y = 0; y < 64; ++y) {
        const uint8_t* first = buf.pixel(0, y);
        for (int x = 1; x < 64; ++x) {
            const uint8_t* p = buf.pixel(x, y);
            REQUIRE(p[0] == first[0]);
            REQUIRE(p[1] == first[1]);
            REQUIRE(p[2] == first[2]);
            REQUIRE(p[3] == first[3]);
        }
        rows.insert(std::make_tuple(first[0], first[1], first[2], first[3]));
    }
    // 64 draws over 256 grey levels: a few collide, most rows are distinct.
    CHECK(rows.size() > 32u);
}

TEST_CASE("generate_noise: invalid variant and NaN parameters fail without a buffer") {
    PixelBuffer buf;
    buf.resize(40, 40);

    NoiseOptions bad_variant = base_opts(NoiseVariant::Film);
    bad_variant.variant = static_cast<NoiseVariant>(9);
    NoiseStatus st = generate_noise(bad_variant, buf);
    CHECK(st.code == NoiseError::InvalidVariant);
    CHECK(buf.empty());
    CHECK(buf.bytes.empty());

    buf.resize(40, 40);
    NoiseOptions bad_num = base_opts(NoiseVariant::Film);
    bad_num.contrast = std::nanf("");
    st = generate_noise(bad_num, buf);
    CHECK(st.code == NoiseError::InvalidNumericParameter);
    CHECK(!st.message.empty());
    CHECK(buf.empty());
}
