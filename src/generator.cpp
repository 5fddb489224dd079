#include "generator.hpp"
#include "compositor.hpp"
#include "noise_field.hpp"

#include <new>
#include <utility>

NoiseStatus generate_noise(const NoiseOptions& options, PixelBuffer& out)
{
    out.clear();

    NoiseOptions opts;
    NoiseStatus  st = sanitize_options(options, opts);
    if (!st.ok()) return st;

    PixelBuffer buf;
    try {
        NoiseField field;
        generate_field(opts, field);
        composite(field, opts, buf);
    } catch (const std::bad_alloc&) {
        return noise_fail(NoiseError::InvalidDimensions,
                          "out of memory for " + std::to_string(opts.width) + "x" +
                          std::to_string(opts.height) + " texture");
    }

    out = std::move(buf);
    return st;
}
