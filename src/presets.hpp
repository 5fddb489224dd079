#pragma once

#include "noise_options.hpp"

static constexpr int PRESET_COUNT = 5;

struct VariantInfo {
    NoiseVariant variant;
    const char*  label;
    const char*  description;
};

struct NoisePreset {
    const char*  name;
    const char*  description;
    NoiseOptions options;
};

extern const VariantInfo g_variant_info[VARIANT_COUNT];

// Must be called once before g_presets is read.
void init_presets();

extern NoisePreset g_presets[PRESET_COUNT];

// Case-sensitive lookup by name; nullptr when there is no such preset.
const NoisePreset* find_preset(const char* name);

// Copies the look of a preset (variant, intensity, alpha, contrast, scale,
// tint) onto opts, keeping its size and seed.
void apply_preset(const NoisePreset& preset, NoiseOptions& opts);
