#include "base64.hpp"

static const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t size)
{
    std::string out;
    out.reserve((size + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                         | (static_cast<uint32_t>(data[i + 1]) << 8)
                         |  static_cast<uint32_t>(data[i + 2]);
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += BASE64_ALPHABET[(n >>  6) & 63];
        out += BASE64_ALPHABET[ n        & 63];
    }

    const size_t rest = size - i;
    if (rest == 1) {
        const uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                         | (static_cast<uint32_t>(data[i + 1]) << 8);
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += BASE64_ALPHABET[(n >>  6) & 63];
        out += '=';
    }
    return out;
}
