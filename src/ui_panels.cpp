#include "ui_panels.hpp"
#include "app_state.hpp"
#include "export.hpp"
#include "presets.hpp"
#include "seed_stream.hpp"
#include "imgui.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

static void sync_tint_text(AppState& app)
{
    const std::string hex = format_color(app.opts.tint);
    std::snprintf(app.tint_text, sizeof(app.tint_text), "%s", hex.c_str());
}

// ---------------------------------------------------------------------------
// Side panel: preset, variant, size, adjustments, tint, seed
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, float menu_h, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    NoiseOptions& o = app.opts;

    // --- Preset ---
    ImGui::TextDisabled("PRESET");
    ImGui::Separator();
    {
        const char* current = (app.preset_sel >= 0) ? g_presets[app.preset_sel].name : "(custom)";
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##preset", current)) {
            for (int i = 0; i < PRESET_COUNT; ++i) {
                if (ImGui::Selectable(g_presets[i].name, app.preset_sel == i)) {
                    app.preset_sel = i;
                    apply_preset(g_presets[i], o);
                    sync_tint_text(app);
                    app.dirty = true;
                }
                if (ImGui::IsItemHovered())
                    ImGui::SetTooltip("%s", g_presets[i].description);
            }
            ImGui::EndCombo();
        }
    }

    // --- Variant ---
    ImGui::Spacing();
    ImGui::TextDisabled("VARIANT");
    ImGui::Separator();
    for (const auto& v : g_variant_info) {
        if (ImGui::RadioButton(v.label, o.variant == v.variant)) {
            o.variant      = v.variant;
            app.preset_sel = -1;
            app.dirty      = true;
        }
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("%s", v.description);
    }

    // --- Size ---
    ImGui::Spacing();
    ImGui::TextDisabled("SIZE");
    ImGui::Separator();
    ImGui::SetNextItemWidth(120.0f);
    if (ImGui::InputInt("Width", &o.width, 32, 256, ImGuiInputTextFlags_EnterReturnsTrue)) {
        o.width   = std::max(MIN_DIMENSION, std::min(o.width, MAX_DIMENSION));
        app.dirty = true;
    }
    ImGui::SetNextItemWidth(120.0f);
    if (ImGui::InputInt("Height", &o.height, 32, 256, ImGuiInputTextFlags_EnterReturnsTrue)) {
        o.height  = std::max(MIN_DIMENSION, std::min(o.height, MAX_DIMENSION));
        app.dirty = true;
    }

    // --- Adjustments ---
    ImGui::Spacing();
    ImGui::TextDisabled("ADJUSTMENTS");
    ImGui::Separator();
    {
        bool changed = false;
        ImGui::SetNextItemWidth(-90.0f);
        changed |= ImGui::SliderFloat("Intensity", &o.intensity, 0.0f, 1.0f, "%.2f");
        ImGui::SetNextItemWidth(-90.0f);
        changed |= ImGui::SliderFloat("Opacity",   &o.alpha,     0.0f, 1.0f, "%.2f");
        ImGui::SetNextItemWidth(-90.0f);
        changed |= ImGui::SliderFloat("Contrast",  &o.contrast,  0.0f, 1.0f, "%.2f");
        ImGui::SetNextItemWidth(-90.0f);
        changed |= ImGui::SliderInt("Scale", &o.scale, 1, 16, "%dx");
        if (o.variant == NoiseVariant::Lines && ImGui::IsItemHovered())
            ImGui::SetTooltip("Scan lines sample once per row; scale has no effect");
        if (changed) {
            app.preset_sel = -1;
            app.dirty      = true;
        }
    }

    // --- Tint ---
    ImGui::Spacing();
    ImGui::TextDisabled("TINT");
    ImGui::Separator();
    {
        float col[3] = {o.tint.r / 255.0f, o.tint.g / 255.0f, o.tint.b / 255.0f};
        if (ImGui::ColorEdit3("##tint", col, ImGuiColorEditFlags_NoInputs)) {
            o.tint.r = static_cast<uint8_t>(std::max(0.0f, std::min(col[0], 1.0f)) * 255.0f + 0.5f);
            o.tint.g = static_cast<uint8_t>(std::max(0.0f, std::min(col[1], 1.0f)) * 255.0f + 0.5f);
            o.tint.b = static_cast<uint8_t>(std::max(0.0f, std::min(col[2], 1.0f)) * 255.0f + 0.5f);
            sync_tint_text(app);
            app.preset_sel = -1;
            app.dirty      = true;
        }
        ImGui::SameLine();
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::InputText("##tint_text", app.tint_text, sizeof(app.tint_text),
                             ImGuiInputTextFlags_EnterReturnsTrue)) {
            // Unparseable text falls back to white.
            if (!parse_color(app.tint_text, o.tint))
                o.tint = Rgb8{};
            sync_tint_text(app);
            app.preset_sel = -1;
            app.dirty      = true;
        }
        ImGui::SetNextItemWidth(-90.0f);
        if (ImGui::SliderFloat("Strength", &o.tint_strength, 0.0f, 1.0f, "%.2f")) {
            app.preset_sel = -1;
            app.dirty      = true;
        }
    }

    // --- Seed ---
    ImGui::Spacing();
    ImGui::TextDisabled("SEED");
    ImGui::Separator();
    ImGui::SetNextItemWidth(140.0f);
    if (ImGui::InputScalar("##seed", ImGuiDataType_U32, &o.seed, nullptr, nullptr, "%u"))
        app.dirty = true;
    ImGui::SameLine();
    if (ImGui::Button("Shuffle", ImVec2(-1.0f, 0.0f))) {
        o.seed    = make_random_seed();
        app.dirty = true;
    }

    // --- Preview ---
    ImGui::Spacing();
    ImGui::TextDisabled("PREVIEW");
    ImGui::Separator();
    ImGui::Checkbox("Checkerboard", &app.checkerboard);
    ImGui::SetNextItemWidth(-90.0f);
    ImGui::SliderFloat("Zoom", &app.zoom, 0.25f, 8.0f, "%.2fx", ImGuiSliderFlags_Logarithmic);

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Preview area: texture centred over a checkerboard so alpha is visible
// ---------------------------------------------------------------------------
void draw_preview(AppState& app, float x, float y, float w, float h)
{
    ImGui::SetNextWindowPos(ImVec2(x, y));
    ImGui::SetNextWindowSize(ImVec2(w, h));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("##preview", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::PopStyleVar();

    const ImGuiIO& io = ImGui::GetIO();
    if (ImGui::IsWindowHovered() && io.KeyCtrl && io.MouseWheel != 0.0f) {
        const float factor = (io.MouseWheel > 0.0f) ? 1.25f : (1.0f / 1.25f);
        app.zoom = std::max(0.25f, std::min(app.zoom * factor, 8.0f));
    }

    if (app.preview_tex.id) {
        const float iw = app.preview_tex.w * app.zoom;
        const float ih = app.preview_tex.h * app.zoom;
        const ImVec2 origin = ImGui::GetCursorScreenPos();
        const float ox = origin.x + std::max(0.0f, (w - iw) * 0.5f);
        const float oy = origin.y + std::max(0.0f, (h - ih) * 0.5f);

        ImDrawList* dl = ImGui::GetWindowDrawList();
        if (app.checkerboard) {
            const float cell = 12.0f;
            const float x1   = ox + iw;
            const float y1   = oy + ih;
            int row = 0;
            for (float cy = oy; cy < y1; cy += cell, ++row) {
                int col = 0;
                for (float cx = ox; cx < x1; cx += cell, ++col) {
                    const ImU32 c = ((row + col) & 1) ? IM_COL32(90, 90, 90, 255)
                                                      : IM_COL32(60, 60, 60, 255);
                    dl->AddRectFilled(ImVec2(cx, cy),
                                      ImVec2(std::min(cx + cell, x1), std::min(cy + cell, y1)), c);
                }
            }
        }

        ImGui::SetCursorScreenPos(ImVec2(ox, oy));
        ImGui::Image(app.preview_tex.imgui_id(), ImVec2(iw, ih));
    }

    ImGui::End();  // ##preview
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(const AppState& app, float fw, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    if (!app.gen_status.ok()) {
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s: %s",
                           noise_error_name(app.gen_status.code),
                           app.gen_status.message.c_str());
    } else {
        ImGui::Text("%d x %d   %s   scale %d   seed %u   %.0f ms%s",
                    app.pbuf.width, app.pbuf.height, variant_name(app.opts.variant),
                    app.opts.scale, app.opts.seed, app.gen_ms,
                    app.generating ? "   generating..." : "");
    }
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Export dialog
// ---------------------------------------------------------------------------
void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export Texture##dlg");
        app.show_export = false;
    }
    if (!ImGui::BeginPopupModal("Export Texture##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    // Format selector
    ImGui::TextDisabled("FORMAT");
    ImGui::Separator();
    ImGui::RadioButton("PNG", &app.exp_fmt, 0);
    ImGui::SameLine();
    if (jxl_available()) {
        ImGui::RadioButton("JPEG XL (lossless)", &app.exp_fmt, 1);
    } else {
        ImGui::TextDisabled("JXL (not available)");
        if (app.exp_fmt == 1) app.exp_fmt = 0;
    }
    ImGui::SameLine();
    ImGui::RadioButton("Data URL", &app.exp_fmt, 2);

    // Options summary, accepted back by noisesmith-cli
    ImGui::Spacing();
    ImGui::TextDisabled("OPTIONS");
    ImGui::Separator();
    {
        std::string summary = format_options(app.opts);
        ImGui::PushTextWrapPos(ImGui::GetCursorPosX() + 420.0f);
        ImGui::TextUnformatted(summary.c_str());
        ImGui::PopTextWrapPos();
        if (ImGui::SmallButton("Copy options"))
            ImGui::SetClipboardText(summary.c_str());
    }

    ImGui::Spacing();
    ImGui::TextDisabled("OUTPUT");
    ImGui::Separator();

    const char* ext = (app.exp_fmt == 1) ? "jxl" : "png";
    const std::string filename = export_file_name(app.opts, ext);
    if (app.exp_fmt == 2)
        ImGui::Text("Clipboard (data:image/png;base64,...)");
    else
        ImGui::Text("%s", filename.c_str());

    if (!app.exp_done) {
        // The preview buffer is what gets exported; generation stays on the
        // worker, so wait for it to catch up with the options.
        const bool ready = !app.dirty && !app.generating &&
                           app.gen_status.ok() && !app.pbuf.empty();
        ImGui::Spacing();
        if (!ready) ImGui::BeginDisabled();
        if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
            const ExportFormat fmt = static_cast<ExportFormat>(app.exp_fmt);
            app.exp_saved_name = (fmt == ExportFormat::DataUrl) ? std::string("clipboard")
                                                                : filename;
            std::string url;
            app.exp_msg = export_buffer(app.pbuf, fmt, filename.c_str(), url);
            if (app.exp_msg.empty() && fmt == ExportFormat::DataUrl)
                ImGui::SetClipboardText(url.c_str());
            if (!app.exp_msg.empty())
                fprintf(stderr, "export failed: %s\n", app.exp_msg.c_str());
            app.exp_done = true;
        }
        if (!ready) {
            ImGui::EndDisabled();
            ImGui::SameLine();
            ImGui::TextDisabled(app.gen_status.ok() ? "generating..." : "no texture to export");
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    } else {
        ImGui::Spacing();
        if (app.exp_msg.empty()) {
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f),
                               "Saved: %s", app.exp_saved_name.c_str());
        } else {
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f),
                               "Error: %s", app.exp_msg.c_str());
        }
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (ImGui::BeginPopupModal("About##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("NoiseSmith  v1.0");
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::Text("Reproducible noise textures for design work.");
        ImGui::Text("Film  |  Grain  |  Speckle  |  Dust  |  Scan lines");
        ImGui::Spacing();
        ImGui::TextDisabled("Same seed and settings, same pixels, every time");
        ImGui::TextDisabled("Transparent output for overlaying any background");
        ImGui::TextDisabled("PNG, JPEG XL lossless and data URL export");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng, libjxl");
        ImGui::Spacing();
        ImGui::SetCursorPosX(
            (ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f
            + ImGui::GetCursorPosX());
        if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
