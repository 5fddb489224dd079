#pragma once

#include "noise_options.hpp"

#include <string>
#include <vector>

enum class CliCommand {
    Generate,
    Help,
    List,
    Benchmark,
};

// Parsed noisesmith-cli command line.
struct CliArgs {
    CliCommand   command    = CliCommand::Generate;
    NoiseOptions opts;
    bool         seed_given = false;  // seed= or seed-text= appeared
    bool         data_url   = false;
    int          batch      = 0;
    std::string  out_path;
    std::string  out_dir;

    // Parsing stops at the first problem. A bad option value sets status;
    // a bad flag sets usage_error.
    NoiseStatus  status;
    std::string  usage_error;

    bool ok() const { return status.ok() && usage_error.empty(); }
};

// args excludes the program name. Reads g_presets, so init_presets() must
// have run.
CliArgs parse_cli_args(const std::vector<std::string>& args);
