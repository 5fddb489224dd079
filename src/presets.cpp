#include "presets.hpp"

#include <cstring>

const VariantInfo g_variant_info[VARIANT_COUNT] = {
    {NoiseVariant::Film,    "Film",       "Classic film grain with random luminance"},
    {NoiseVariant::Grain,   "Grain",      "Soft multi-sample grain with smoother specks"},
    {NoiseVariant::Speckle, "Speckle",    "High contrast speckles for retro posters"},
    {NoiseVariant::Dust,    "Dust",       "Sparse dust specks for aged photography"},
    {NoiseVariant::Lines,   "Scan lines", "Horizontal scan lines for CRT vibes"},
};

NoisePreset g_presets[PRESET_COUNT];

static void set_preset(int idx, const char* name, const char* description,
                       NoiseVariant variant, float intensity, float alpha,
                       float contrast, int scale, Rgb8 tint, float tint_strength)
{
    NoisePreset& p = g_presets[idx];
    p.name        = name;
    p.description = description;
    p.options     = NoiseOptions{};
    p.options.variant       = variant;
    p.options.intensity     = intensity;
    p.options.alpha         = alpha;
    p.options.contrast      = contrast;
    p.options.scale         = scale;
    p.options.tint          = tint;
    p.options.tint_strength = tint_strength;
}

void init_presets()
{
    const Rgb8 white = {255, 255, 255};
    const Rgb8 sepia = {112,  66,  20};
    const Rgb8 phos  = { 51, 255, 102};

    // 0: the tool's default look
    set_preset(0, "subtle-film", "Light film grain over any background",
               NoiseVariant::Film,    0.70f, 0.25f, 0.10f, 2, white, 0.0f);
    // 1: smoother, larger grain
    set_preset(1, "soft-grain",  "Low-variance grain for gradients",
               NoiseVariant::Grain,   0.80f, 0.35f, 0.30f, 3, white, 0.0f);
    // 2: poster specks
    set_preset(2, "retro-speckle", "Punchy specks for print-style posters",
               NoiseVariant::Speckle, 0.90f, 0.60f, 0.50f, 2, white, 0.0f);
    // 3: sepia dust
    set_preset(3, "aged-dust",   "Sparse warm dust for old photographs",
               NoiseVariant::Dust,    0.60f, 0.70f, 0.20f, 1, sepia, 0.35f);
    // 4: green phosphor scan lines
    set_preset(4, "crt-lines",   "Phosphor scan lines for terminal mockups",
               NoiseVariant::Lines,   0.50f, 0.30f, 0.40f, 1, phos,  0.50f);
}

const NoisePreset* find_preset(const char* name)
{
    for (int i = 0; i < PRESET_COUNT; ++i) {
        if (g_presets[i].name && std::strcmp(g_presets[i].name, name) == 0)
            return &g_presets[i];
    }
    return nullptr;
}

void apply_preset(const NoisePreset& preset, NoiseOptions& opts)
{
    const int      w    = opts.width;
    const int      h    = opts.height;
    const uint32_t seed = opts.seed;
    opts        = preset.options;
    opts.width  = w;
    opts.height = h;
    opts.seed   = seed;
}
