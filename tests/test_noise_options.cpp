// tests/test_noise_options.cpp
#include <doctest/doctest.h>

#include "noise_options.hpp"
#include "seed_stream.hpp"

#include <cmath>
#include <set>
#include <string>

static bool same_rgb(Rgb8 a, Rgb8 b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

TEST_CASE("parse_color: hex forms") {
    Rgb8 c;
    REQUIRE(parse_color("#3366cc", c));
    CHECK(same_rgb(c, Rgb8{0x33, 0x66, 0xcc}));

    REQUIRE(parse_color("#36C", c));
    CHECK(same_rgb(c, Rgb8{0x33, 0x66, 0xcc}));

    REQUIRE(parse_color("  #FFFFFF ", c));
    CHECK(same_rgb(c, Rgb8{255, 255, 255}));
}

TEST_CASE("parse_color: rgb() and rgba() forms") {
    Rgb8 c;
    REQUIRE(parse_color("rgb(12, 34, 56)", c));
    CHECK(same_rgb(c, Rgb8{12, 34, 56}));

    REQUIRE(parse_color("RGBA(1,2,3,0.5)", c));
    CHECK(same_rgb(c, Rgb8{1, 2, 3}));

    // Channels saturate at 255.
    REQUIRE(parse_color("rgb(300, 0, 999999)", c));
    CHECK(same_rgb(c, Rgb8{255, 0, 255}));
}

TEST_CASE("parse_color: rejects malformed text and leaves the output alone") {
    const Rgb8 before{10, 20, 30};
    for (const char* bad : {"", "#", "#12", "#1234", "#gggggg", "red", "rgb(1,2)", "rgb(a,b,c)",
                            "hsl(0,0,0)"}) {
        CAPTURE(bad);
        Rgb8 c = before;
        CHECK_FALSE(parse_color(bad, c));
        CHECK(same_rgb(c, before));
    }
}

TEST_CASE("format_color: lower-case #rrggbb") {
    CHECK(format_color(Rgb8{0x33, 0x66, 0xcc}) == "#3366cc");
    CHECK(format_color(Rgb8{0, 0, 0}) == "#000000");
    CHECK(format_color(Rgb8{}) == "#ffffff");
}

TEST_CASE("variant names round-trip through parse_variant") {
    for (int i = 0; i < VARIANT_COUNT; ++i) {
        const NoiseVariant v = static_cast<NoiseVariant>(i);
        NoiseVariant parsed = NoiseVariant::Film;
        REQUIRE(parse_variant(variant_name(v), parsed));
        CHECK(parsed == v);
    }
    NoiseVariant v = NoiseVariant::Dust;
    CHECK(parse_variant(" LINES ", v));
    CHECK(v == NoiseVariant::Lines);
    CHECK_FALSE(parse_variant("plasma", v));
    CHECK(v == NoiseVariant::Lines);
}

TEST_CASE("sanitize_options: clamps ranges") {
    NoiseOptions in;
    in.width         = 5;
    in.height        = 100000;
    in.scale         = -3;
    in.intensity     = 4.0f;
    in.alpha         = -1.0f;
    in.contrast      = 0.5f;
    in.tint_strength = 2.0f;

    NoiseOptions out;
    REQUIRE(sanitize_options(in, out).ok());
    CHECK(out.width == MIN_DIMENSION);
    CHECK(out.height == MAX_DIMENSION);
    CHECK(out.scale == 1);
    CHECK(out.intensity == 1.0f);
    CHECK(out.alpha == 0.0f);
    CHECK(out.contrast == 0.5f);
    CHECK(out.tint_strength == 1.0f);
    CHECK(out.seed == in.seed);
}

TEST_CASE("sanitize_options: NaN and bad variants fail, output untouched") {
    NoiseOptions in;
    in.alpha = std::nanf("");
    NoiseOptions out;
    out.width = 77;
    NoiseStatus st = sanitize_options(in, out);
    CHECK(st.code == NoiseError::InvalidNumericParameter);
    CHECK(st.message.find("alpha") != std::string::npos);
    CHECK(out.width == 77);

    NoiseOptions bad;
    bad.variant = static_cast<NoiseVariant>(-1);
    st = sanitize_options(bad, out);
    CHECK(st.code == NoiseError::InvalidVariant);
}

TEST_CASE("apply_option: each key updates its field") {
    NoiseOptions o;
    CHECK(apply_option(o, "width", "640").ok());
    CHECK(apply_option(o, "HEIGHT", " 480 ").ok());
    CHECK(apply_option(o, "variant", "speckle").ok());
    CHECK(apply_option(o, "intensity", "0.9").ok());
    CHECK(apply_option(o, "alpha", "0.5").ok());
    CHECK(apply_option(o, "contrast", "1").ok());
    CHECK(apply_option(o, "scale", "3.7").ok());
    CHECK(apply_option(o, "seed", "42").ok());
    CHECK(apply_option(o, "tint", "#112233").ok());
    CHECK(apply_option(o, "tint-strength", "0.25").ok());

    CHECK(o.width == 640);
    CHECK(o.height == 480);
    CHECK(o.variant == NoiseVariant::Speckle);
    CHECK(o.intensity == 0.9f);
    CHECK(o.alpha == 0.5f);
    CHECK(o.contrast == 1.0f);
    CHECK(o.scale == 3);
    CHECK(o.seed == 42u);
    CHECK(same_rgb(o.tint, Rgb8{0x11, 0x22, 0x33}));
    CHECK(o.tint_strength == 0.25f);

    CHECK(apply_option(o, "tint_strength", "0.75").ok());
    CHECK(o.tint_strength == 0.75f);
}

TEST_CASE("apply_option: error kinds") {
    NoiseOptions o;
    CHECK(apply_option(o, "width", "wide").code == NoiseError::InvalidDimensions);
    CHECK(apply_option(o, "height", "").code == NoiseError::InvalidDimensions);
    CHECK(apply_option(o, "variant", "plasma").code == NoiseError::InvalidVariant);
    CHECK(apply_option(o, "intensity", "lots").code == NoiseError::InvalidNumericParameter);
    CHECK(apply_option(o, "alpha", "nan").code == NoiseError::InvalidNumericParameter);
    CHECK(apply_option(o, "contrast", "0.5x").code == NoiseError::InvalidNumericParameter);
    CHECK(apply_option(o, "tint", "blue").code == NoiseError::InvalidNumericParameter);
    CHECK(apply_option(o, "blur", "3").code == NoiseError::UnknownOption);

    // Failed options leave the record as it was.
    const NoiseOptions defaults;
    CHECK(o.width == defaults.width);
    CHECK(o.variant == defaults.variant);
    CHECK(o.intensity == defaults.intensity);
}

TEST_CASE("apply_option: out-of-range numbers are kept for clamping later") {
    NoiseOptions o;
    REQUIRE(apply_option(o, "width", "1e9").ok());
    REQUIRE(apply_option(o, "intensity", "1e30").ok());
    NoiseOptions s;
    REQUIRE(sanitize_options(o, s).ok());
    CHECK(s.width == MAX_DIMENSION);
    CHECK(s.intensity == 1.0f);
}

TEST_CASE("apply_option: seed covers the full 32-bit range") {
    NoiseOptions o;
    REQUIRE(apply_option(o, "seed", "4294967295").ok());
    CHECK(o.seed == 0xFFFFFFFFu);
    REQUIRE(apply_option(o, "seed", "-1").ok());
    CHECK(o.seed == 0xFFFFFFFFu);
    REQUIRE(apply_option(o, "seed", "0").ok());
    CHECK(o.seed == 0u);
    CHECK(apply_option(o, "seed", "4294967296").code == NoiseError::InvalidNumericParameter);
    CHECK(o.seed == 0u);
}

TEST_CASE("apply_option_arg: needs key=value") {
    NoiseOptions o;
    CHECK(apply_option_arg(o, "scale=4").ok());
    CHECK(o.scale == 4);
    CHECK(apply_option_arg(o, "scale").code == NoiseError::UnknownOption);
    CHECK(apply_option_arg(o, "=4").code == NoiseError::UnknownOption);
    CHECK(apply_option_arg(o, "width=").code == NoiseError::InvalidDimensions);
}

TEST_CASE("apply_option: seed-text hashes the raw text") {
    NoiseOptions o;
    REQUIRE(apply_option(o, "seed-text", "seed-k3x9q1").ok());
    CHECK(o.seed == string_to_seed("seed-k3x9q1"));
    REQUIRE(apply_option(o, "SEED_TEXT", "Seed-K3X9Q1").ok());
    CHECK(o.seed == string_to_seed("Seed-K3X9Q1"));
    CHECK(o.seed != string_to_seed("seed-k3x9q1"));
}

TEST_CASE("apply_option_arg: reports the normalized key") {
    NoiseOptions o;
    std::string key;
    REQUIRE(apply_option_arg(o, "Tint_Strength=0.5", &key).ok());
    CHECK(key == "tint-strength");
    REQUIRE(apply_option_arg(o, " SEED =9", &key).ok());
    CHECK(key == "seed");
    CHECK(o.seed == 9u);

    key = "unchanged";
    CHECK_FALSE(apply_option_arg(o, "seed=x", &key).ok());
    CHECK(key == "unchanged");
}

TEST_CASE("format_options: summary reads back to the same options") {
    NoiseOptions o;
    o.width         = 300;
    o.height        = 200;
    o.variant       = NoiseVariant::Dust;
    o.intensity     = 0.33f;
    o.alpha         = 0.1f;
    o.contrast      = 0.0f;
    o.scale         = 5;
    o.seed          = 4000000000u;
    o.tint          = Rgb8{1, 2, 3};
    o.tint_strength = 0.7f;

    const std::string text = format_options(o);
    CHECK(text.find("variant=dust") != std::string::npos);
    CHECK(text.find("tint=#010203") != std::string::npos);

    NoiseOptions back;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find(' ', start);
        if (end == std::string::npos) end = text.size();
        const std::string arg = text.substr(start, end - start);
        CAPTURE(arg);
        REQUIRE(apply_option_arg(back, arg).ok());
        start = end + 1;
    }
    CHECK(format_options(back) == text);
    CHECK(back.intensity == o.intensity);
    CHECK(back.seed == o.seed);
}

TEST_CASE("noise_error_name: one distinct name per kind") {
    std::set<std::string> names;
    for (NoiseError e : {NoiseError::None, NoiseError::InvalidDimensions, NoiseError::InvalidVariant,
                         NoiseError::InvalidNumericParameter, NoiseError::UnknownOption,
                         NoiseError::EncodingFailure})
        names.insert(noise_error_name(e));
    CHECK(names.size() == 6u);
}
