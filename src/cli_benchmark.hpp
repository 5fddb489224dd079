#pragma once

#include "generator.hpp"
#include "noise_options.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

inline int run_cli_benchmark()
{
    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;

    struct TestCase {
        const char*  label;
        NoiseVariant variant;
        int          scale;
    };

    const TestCase tests[] = {
        {"Film",            NoiseVariant::Film,    1},
        {"Film (scale 4)",  NoiseVariant::Film,    4},
        {"Grain",           NoiseVariant::Grain,   1},
        {"Speckle",         NoiseVariant::Speckle, 1},
        {"Dust",            NoiseVariant::Dust,    1},
        {"Scan lines",      NoiseVariant::Lines,   1},
    };

    printf("NoiseSmith CLI Benchmark\n");
    printf("%dx%d, 1 thread, %d runs (avg best %d)\n\n", W, H, RUNS, BEST_N);
    printf("%-24s %s\n", "Label", "Mpix/s");
    printf("--------------------------------\n");

    using clock = std::chrono::steady_clock;
    PixelBuffer buf;

    for (const auto& t : tests) {
        NoiseOptions opts;
        opts.width   = W;
        opts.height  = H;
        opts.variant = t.variant;
        opts.scale   = t.scale;
        opts.seed    = 42;

        // Warm-up
        NoiseStatus st = generate_noise(opts, buf);
        if (!st.ok()) {
            fprintf(stderr, "benchmark: %s: %s\n", t.label, st.message.c_str());
            return 2;
        }

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            const auto t0 = clock::now();
            st = generate_noise(opts, buf);
            times[r] = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = (W * H) / (std::max(avg_ms, 1e-3) * 1000.0);

        printf("%-24s %6.2f\n", t.label, mpixs);
    }
    return 0;
}
