#pragma once

struct AppState;

static constexpr float PANEL_WIDTH   = 300.0f;
static constexpr float STATUS_HEIGHT = 24.0f;

void draw_side_panel(AppState& app, float menu_h, float fh);
void draw_preview(AppState& app, float x, float y, float w, float h);
void draw_status_bar(const AppState& app, float fw, float fh);
void draw_export_dialog(AppState& app);
void draw_about_dialog(AppState& app);
