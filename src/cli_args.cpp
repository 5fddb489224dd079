#include "cli_args.hpp"
#include "presets.hpp"

#include <cstdlib>

static bool parse_batch_count(const std::string& text, int& out)
{
    if (text.empty()) return false;
    char* end = nullptr;
    const long n = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || n < 1 || n > 100000) return false;
    out = static_cast<int>(n);
    return true;
}

CliArgs parse_cli_args(const std::vector<std::string>& args)
{
    CliArgs out;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto need_value = [&](const char* flag) -> const std::string* {
            if (i + 1 >= args.size()) {
                out.usage_error = std::string(flag) + " needs a value";
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            out.command = CliCommand::Help;
            return out;
        } else if (arg == "--list") {
            out.command = CliCommand::List;
            return out;
        } else if (arg == "--benchmark") {
            out.command = CliCommand::Benchmark;
            return out;
        } else if (arg == "--data-url") {
            out.data_url = true;
        } else if (arg == "--preset") {
            const std::string* name = need_value("--preset");
            if (!name) return out;
            const NoisePreset* p = find_preset(name->c_str());
            if (!p) {
                out.usage_error = "unknown preset '" + *name + "' (see --list)";
                return out;
            }
            apply_preset(*p, out.opts);
        } else if (arg == "--out") {
            const std::string* v = need_value("--out");
            if (!v) return out;
            out.out_path = *v;
        } else if (arg == "--out-dir") {
            const std::string* v = need_value("--out-dir");
            if (!v) return out;
            out.out_dir = *v;
        } else if (arg == "--batch") {
            const std::string* v = need_value("--batch");
            if (!v) return out;
            if (!parse_batch_count(*v, out.batch)) {
                out.usage_error = "--batch expects a count between 1 and 100000";
                return out;
            }
        } else if (arg.compare(0, 2, "--") == 0) {
            out.usage_error = "unknown flag '" + arg + "'";
            return out;
        } else {
            std::string key;
            out.status = apply_option_arg(out.opts, arg, &key);
            if (!out.status.ok()) return out;
            if (key == "seed" || key == "seed-text") out.seed_given = true;
        }
    }
    return out;
}
