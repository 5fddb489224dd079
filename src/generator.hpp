#pragma once

#include "noise_options.hpp"
#include "pixel_buffer.hpp"

// Generates one noise texture.
//
// Options are validated and clamped first (see sanitize_options). On success
// out holds exactly width*height RGBA8 pixels; on failure out is left empty
// and the status says why. Identical options always give identical bytes.
//
// Pure and re-entrant: no state survives between calls, so it is safe to call
// from any thread, including several at once.
NoiseStatus generate_noise(const NoiseOptions& options, PixelBuffer& out);
