#include "cli_args.hpp"
#include "cli_benchmark.hpp"
#include "export.hpp"
#include "generator.hpp"
#include "noise_options.hpp"
#include "presets.hpp"
#include "seed_stream.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// Exit codes
static constexpr int EXIT_OK      = 0;
static constexpr int EXIT_USAGE   = 1;
static constexpr int EXIT_PARAMS  = 2;
static constexpr int EXIT_ENCODER = 3;

static void print_usage(const char* argv0)
{
    printf("usage: %s [key=value ...] [options]\n\n", argv0);
    printf("keys:\n");
    printf("  width=N height=N      32-4096 (default 512x512)\n");
    printf("  variant=NAME          film | grain | speckle | dust | lines\n");
    printf("  intensity=F alpha=F contrast=F tint-strength=F   0-1\n");
    printf("  scale=N               grain block size in pixels (>= 1)\n");
    printf("  seed=N                32-bit seed (random when omitted)\n");
    printf("  seed-text=TEXT        seed hashed from a text string\n");
    printf("  tint=COLOR            #rgb, #rrggbb or rgb(r, g, b)\n\n");
    printf("options:\n");
    printf("  --preset NAME         start from a named preset (see --list)\n");
    printf("  --out FILE            write FILE (.png, or .jxl when available)\n");
    printf("  --data-url            print a PNG data URL to stdout\n");
    printf("  --batch N             write N textures with seeds seed..seed+N-1\n");
    printf("  --out-dir DIR         directory for --batch output (default .)\n");
    printf("  --list                list variants and presets\n");
    printf("  --benchmark           run the generation benchmark\n");
}

static void print_list()
{
    printf("variants:\n");
    for (const auto& v : g_variant_info)
        printf("  %-10s %s\n", variant_name(v.variant), v.description);
    printf("\npresets:\n");
    for (const auto& p : g_presets)
        printf("  %-15s %s\n", p.name, p.description);
}

static bool ends_with(const std::string& s, const char* suffix)
{
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

static int report_params(const NoiseStatus& st)
{
    fprintf(stderr, "error: %s: %s\n", noise_error_name(st.code), st.message.c_str());
    return EXIT_PARAMS;
}

static int report_encoder(const std::string& msg)
{
    fprintf(stderr, "error: %s: %s\n",
            noise_error_name(NoiseError::EncodingFailure), msg.c_str());
    return EXIT_ENCODER;
}

// Picks the encoder from the file extension.
static std::string write_image(const std::string& path, const PixelBuffer& buf)
{
    std::string unused;
    const ExportFormat fmt = ends_with(path, ".jxl") ? ExportFormat::Jxl : ExportFormat::Png;
    return export_buffer(buf, fmt, path.c_str(), unused);
}

// ---------------------------------------------------------------------------
// Batch: independent seeds generated in parallel, one file per seed
// ---------------------------------------------------------------------------
static int run_batch(const NoiseOptions& base, int count, const std::string& out_dir)
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;

    struct Job {
        NoiseOptions opts;
        std::string  path;
        NoiseStatus  status;
        std::string  encode_error;
    };
    std::vector<Job> jobs(static_cast<size_t>(count));

    {
        ThreadPool pool(std::min(n, count));
        for (int i = 0; i < count; ++i) {
            Job& job = jobs[static_cast<size_t>(i)];
            job.opts      = base;
            job.opts.seed = base.seed + static_cast<uint32_t>(i);
            std::string name = export_file_name(job.opts, "png");
            name.insert(name.size() - 4, "-" + std::to_string(job.opts.seed));
            job.path = out_dir.empty() ? name : out_dir + "/" + name;

            pool.submit([&job] {
                PixelBuffer buf;
                job.status = generate_noise(job.opts, buf);
                if (job.status.ok())
                    job.encode_error = export_png(job.path.c_str(), buf);
            });
        }
        pool.wait();
    }

    int rc = EXIT_OK;
    for (const Job& job : jobs) {
        if (!job.status.ok())
            rc = std::max(rc, report_params(job.status));
        else if (!job.encode_error.empty())
            rc = std::max(rc, report_encoder(job.encode_error));
        else
            printf("%s\n", job.path.c_str());
    }
    return rc;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    init_presets();

    CliArgs cli = parse_cli_args(std::vector<std::string>(argv + 1, argv + argc));
    if (!cli.usage_error.empty()) {
        fprintf(stderr, "error: %s\n", cli.usage_error.c_str());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (!cli.status.ok()) return report_params(cli.status);

    switch (cli.command) {
        case CliCommand::Help:      print_usage(argv[0]); return EXIT_OK;
        case CliCommand::List:      print_list();         return EXIT_OK;
        case CliCommand::Benchmark: return run_cli_benchmark();
        case CliCommand::Generate:  break;
    }

    NoiseOptions& opts = cli.opts;
    if (!cli.seed_given) {
        opts.seed = make_random_seed();
        fprintf(stderr, "seed: %u\n", opts.seed);
    }

    // Report the clamped values that will actually be used.
    NoiseOptions used;
    const NoiseStatus check = sanitize_options(opts, used);
    if (!check.ok()) return report_params(check);
    fprintf(stderr, "%s\n", format_options(used).c_str());

    if (cli.batch > 0)
        return run_batch(used, cli.batch, cli.out_dir);

    PixelBuffer buf;
    const NoiseStatus st = generate_noise(used, buf);
    if (!st.ok()) return report_params(st);

    std::string out_path = cli.out_path;
    if (cli.data_url) {
        std::string url;
        const std::string err = png_data_url(buf, url);
        if (!err.empty()) return report_encoder(err);
        printf("%s\n", url.c_str());
        if (out_path.empty()) return EXIT_OK;
    }

    if (out_path.empty())
        out_path = export_file_name(used, "png");
    const std::string err = write_image(out_path, buf);
    if (!err.empty()) return report_encoder(err);
    fprintf(stderr, "wrote %s (%dx%d)\n", out_path.c_str(), buf.width, buf.height);
    return EXIT_OK;
}
