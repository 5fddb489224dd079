#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Standard base64 (RFC 4648) with '=' padding.
std::string base64_encode(const uint8_t* data, size_t size);
