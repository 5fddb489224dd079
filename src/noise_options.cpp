#include "noise_options.hpp"
#include "seed_stream.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

const char* noise_error_name(NoiseError e)
{
    switch (e) {
        case NoiseError::None:                    return "ok";
        case NoiseError::InvalidDimensions:       return "invalid dimensions";
        case NoiseError::InvalidVariant:          return "invalid variant";
        case NoiseError::InvalidNumericParameter: return "invalid numeric parameter";
        case NoiseError::UnknownOption:           return "unknown option";
        case NoiseError::EncodingFailure:         return "encoding failure";
    }
    return "unknown error";
}

const char* variant_name(NoiseVariant v)
{
    switch (v) {
        case NoiseVariant::Film:    return "film";
        case NoiseVariant::Grain:   return "grain";
        case NoiseVariant::Speckle: return "speckle";
        case NoiseVariant::Dust:    return "dust";
        case NoiseVariant::Lines:   return "lines";
    }
    return "unknown";
}

static std::string trim_lower(const std::string& text)
{
    size_t b = 0, e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i)
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    return out;
}

bool parse_variant(const std::string& text, NoiseVariant& out)
{
    const std::string t = trim_lower(text);
    for (int i = 0; i < VARIANT_COUNT; ++i) {
        const NoiseVariant v = static_cast<NoiseVariant>(i);
        if (t == variant_name(v)) {
            out = v;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Colour parsing
// ---------------------------------------------------------------------------
static int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static bool parse_hex_color(const std::string& t, Rgb8& out)
{
    const size_t n = t.size() - 1;
    if (n != 3 && n != 6) return false;
    int d[6];
    for (size_t i = 0; i < n; ++i) {
        d[i] = hex_digit(t[i + 1]);
        if (d[i] < 0) return false;
    }
    if (n == 3) {
        out.r = static_cast<uint8_t>(d[0] * 17);
        out.g = static_cast<uint8_t>(d[1] * 17);
        out.b = static_cast<uint8_t>(d[2] * 17);
    } else {
        out.r = static_cast<uint8_t>(d[0] * 16 + d[1]);
        out.g = static_cast<uint8_t>(d[2] * 16 + d[3]);
        out.b = static_cast<uint8_t>(d[4] * 16 + d[5]);
    }
    return true;
}

// rgb(r, g, b) / rgba(r, g, b, a): the first three integer channels are used,
// clamped to 0-255; anything after them is ignored.
static bool parse_rgb_function(const std::string& t, Rgb8& out)
{
    size_t pos;
    if (t.compare(0, 5, "rgba(") == 0)     pos = 5;
    else if (t.compare(0, 4, "rgb(") == 0) pos = 4;
    else return false;

    long ch[3];
    for (int i = 0; i < 3; ++i) {
        while (pos < t.size() && std::isspace(static_cast<unsigned char>(t[pos]))) ++pos;
        if (pos >= t.size() || !std::isdigit(static_cast<unsigned char>(t[pos])))
            return false;
        long v = 0;
        while (pos < t.size() && std::isdigit(static_cast<unsigned char>(t[pos]))) {
            v = std::min(v * 10 + (t[pos] - '0'), 100000L);
            ++pos;
        }
        ch[i] = std::min(v, 255L);
        if (i < 2) {
            while (pos < t.size() && std::isspace(static_cast<unsigned char>(t[pos]))) ++pos;
            if (pos >= t.size() || t[pos] != ',') return false;
            ++pos;
        }
    }
    out.r = static_cast<uint8_t>(ch[0]);
    out.g = static_cast<uint8_t>(ch[1]);
    out.b = static_cast<uint8_t>(ch[2]);
    return true;
}

bool parse_color(const std::string& text, Rgb8& out)
{
    const std::string t = trim_lower(text);
    if (t.empty()) return false;
    Rgb8 c;
    const bool ok = (t[0] == '#') ? parse_hex_color(t, c) : parse_rgb_function(t, c);
    if (ok) out = c;
    return ok;
}

std::string format_color(Rgb8 c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
static NoiseStatus clamp_unit(const char* name, float in, float& out)
{
    if (std::isnan(in))
        return noise_fail(NoiseError::InvalidNumericParameter,
                          std::string(name) + " is not a number");
    out = std::max(0.0f, std::min(in, 1.0f));
    return {};
}

NoiseStatus sanitize_options(const NoiseOptions& in, NoiseOptions& out)
{
    const int v = static_cast<int>(in.variant);
    if (v < 0 || v >= VARIANT_COUNT)
        return noise_fail(NoiseError::InvalidVariant,
                          "variant value " + std::to_string(v) + " is not a known variant");

    NoiseOptions o = in;
    o.width  = std::max(MIN_DIMENSION, std::min(in.width,  MAX_DIMENSION));
    o.height = std::max(MIN_DIMENSION, std::min(in.height, MAX_DIMENSION));
    o.scale  = std::max(1, std::min(in.scale, MAX_SCALE));

    NoiseStatus st;
    if (!(st = clamp_unit("intensity",     in.intensity,     o.intensity)).ok())     return st;
    if (!(st = clamp_unit("alpha",         in.alpha,         o.alpha)).ok())         return st;
    if (!(st = clamp_unit("contrast",      in.contrast,      o.contrast)).ok())      return st;
    if (!(st = clamp_unit("tint-strength", in.tint_strength, o.tint_strength)).ok()) return st;

    out = o;
    return {};
}

// ---------------------------------------------------------------------------
// Text parsing
// ---------------------------------------------------------------------------
// Whole-string decimal number; rejects empty text, trailing junk and NaN.
static bool parse_number(const std::string& text, double& out)
{
    const std::string t = trim_lower(text);
    if (t.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || std::isnan(v)) return false;
    out = v;
    return true;
}

// Integers are floored and saturated so huge inputs still clamp instead of
// overflowing.
static int to_clamped_int(double v)
{
    const double f = std::floor(v);
    if (f < -2147483648.0) return INT32_MIN;
    if (f >  2147483647.0) return INT32_MAX;
    return static_cast<int>(f);
}

static std::string normalize_key(const std::string& key)
{
    std::string k = trim_lower(key);
    std::replace(k.begin(), k.end(), '_', '-');
    return k;
}

NoiseStatus apply_option(NoiseOptions& opts, const std::string& key, const std::string& value)
{
    const std::string k = normalize_key(key);
    double num = 0.0;

    if (k == "width" || k == "height") {
        if (!parse_number(value, num))
            return noise_fail(NoiseError::InvalidDimensions,
                              k + " '" + value + "' is not a number");
        (k == "width" ? opts.width : opts.height) = to_clamped_int(num);
        return {};
    }
    if (k == "variant") {
        if (!parse_variant(value, opts.variant))
            return noise_fail(NoiseError::InvalidVariant,
                              "unknown variant '" + value +
                              "' (expected film, grain, speckle, dust or lines)");
        return {};
    }
    if (k == "seed-text") {
        // Case and spacing matter here: the text itself is the seed.
        opts.seed = string_to_seed(value);
        return {};
    }
    if (k == "tint") {
        if (!parse_color(value, opts.tint))
            return noise_fail(NoiseError::InvalidNumericParameter,
                              "tint '" + value + "' is not a colour");
        return {};
    }

    float* unit = nullptr;
    if (k == "intensity")          unit = &opts.intensity;
    else if (k == "alpha")         unit = &opts.alpha;
    else if (k == "contrast")      unit = &opts.contrast;
    else if (k == "tint-strength") unit = &opts.tint_strength;

    if (!unit && k != "scale" && k != "seed")
        return noise_fail(NoiseError::UnknownOption, "unknown option '" + key + "'");

    if (!parse_number(value, num))
        return noise_fail(NoiseError::InvalidNumericParameter,
                          k + " '" + value + "' is not a number");

    if (unit) {
        *unit = static_cast<float>(std::max(-1.0, std::min(num, 2.0)));
    } else if (k == "scale") {
        opts.scale = to_clamped_int(num);
    } else {
        // Any 32-bit value: negative seeds wrap like two's complement.
        const double f = std::floor(num);
        if (f < -2147483648.0 || f > 4294967295.0)
            return noise_fail(NoiseError::InvalidNumericParameter,
                              "seed '" + value + "' does not fit in 32 bits");
        opts.seed = static_cast<uint32_t>(static_cast<int64_t>(f));
    }
    return {};
}

NoiseStatus apply_option_arg(NoiseOptions& opts, const std::string& arg, std::string* key)
{
    const size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0)
        return noise_fail(NoiseError::UnknownOption,
                          "expected key=value, got '" + arg + "'");
    NoiseStatus st = apply_option(opts, arg.substr(0, eq), arg.substr(eq + 1));
    if (st.ok() && key)
        *key = normalize_key(arg.substr(0, eq));
    return st;
}

// Shortest text that reads back to the same float.
static std::string format_unit(float v)
{
    char buf[32];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

std::string format_options(const NoiseOptions& o)
{
    std::string s;
    s += "width=" + std::to_string(o.width);
    s += " height=" + std::to_string(o.height);
    s += " variant=" + std::string(variant_name(o.variant));
    s += " intensity=" + format_unit(o.intensity);
    s += " alpha=" + format_unit(o.alpha);
    s += " contrast=" + format_unit(o.contrast);
    s += " scale=" + std::to_string(o.scale);
    s += " seed=" + std::to_string(o.seed);
    s += " tint=" + format_color(o.tint);
    s += " tint-strength=" + format_unit(o.tint_strength);
    return s;
}
