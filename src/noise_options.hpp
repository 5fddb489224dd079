#pragma once

#include <cstdint>
#include <string>
#include <utility>

enum class NoiseVariant {
    Film    = 0,  // one draw per cell, uniform grain
    Grain   = 1,  // mean of three draws, softer distribution
    Speckle = 2,  // sparse dark/bright specks
    Dust    = 3,  // far sparser bright specks, density follows intensity
    Lines   = 4,  // one draw per output row
};
constexpr int VARIANT_COUNT = 5;

struct Rgb8 {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
};

static constexpr int MIN_DIMENSION = 32;
static constexpr int MAX_DIMENSION = 4096;
static constexpr int MAX_SCALE     = 4096;

struct NoiseOptions {
    int          width         = 512;
    int          height        = 512;
    NoiseVariant variant       = NoiseVariant::Film;
    float        intensity     = 0.7f;
    float        alpha         = 0.25f;
    float        contrast      = 0.1f;
    int          scale         = 2;
    uint32_t     seed          = 1234;
    Rgb8         tint          = {};
    float        tint_strength = 0.0f;
};

// ---------------------------------------------------------------------------
// Status reporting
// ---------------------------------------------------------------------------
enum class NoiseError {
    None                    = 0,
    InvalidDimensions       = 1,
    InvalidVariant          = 2,
    InvalidNumericParameter = 3,
    UnknownOption           = 4,
    EncodingFailure         = 5,
};

struct NoiseStatus {
    NoiseError  code = NoiseError::None;
    std::string message;

    bool ok() const { return code == NoiseError::None; }
};

inline NoiseStatus noise_fail(NoiseError code, std::string message)
{
    NoiseStatus st;
    st.code    = code;
    st.message = std::move(message);
    return st;
}

const char* noise_error_name(NoiseError e);

// ---------------------------------------------------------------------------
// Variants and colours
// ---------------------------------------------------------------------------
// Lower-case tag used in option text and file names ("film", "grain", ...).
const char* variant_name(NoiseVariant v);

bool parse_variant(const std::string& text, NoiseVariant& out);

// Accepts "#rgb", "#rrggbb", "rgb(r, g, b)" and "rgba(r, g, b, a)".
// Leaves out untouched and returns false on anything else.
bool parse_color(const std::string& text, Rgb8& out);

// "#rrggbb", lower case.
std::string format_color(Rgb8 c);

// ---------------------------------------------------------------------------
// Validation and text parsing
// ---------------------------------------------------------------------------
// Clamps every numeric field into range. Fails on an enum value outside the
// variant set or on a NaN float; out is only written on success.
NoiseStatus sanitize_options(const NoiseOptions& in, NoiseOptions& out);

// Applies one "key=value" pair. Keys: width height variant intensity alpha
// contrast scale seed seed-text tint tint-strength. Keys are case-insensitive
// and '_' reads as '-'. Values that parse are clamped later by
// sanitize_options. seed-text hashes its value with string_to_seed.
NoiseStatus apply_option(NoiseOptions& opts, const std::string& key, const std::string& value);

// Splits "key=value" and forwards to apply_option. On success *key, when
// given, receives the normalized key ("seed", "tint-strength", ...).
NoiseStatus apply_option_arg(NoiseOptions& opts, const std::string& arg,
                             std::string* key = nullptr);

// Space-separated key=value summary that apply_option_arg accepts back.
std::string format_options(const NoiseOptions& opts);
