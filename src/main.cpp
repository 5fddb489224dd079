#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "generator.hpp"
#include "presets.hpp"
#include "seed_stream.hpp"
#include "ui_panels.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <utility>

// ---------------------------------------------------------------------------
// Background generation
//
// At most one job is in flight. Option changes made while it runs leave
// `dirty` set, so the next job starts as soon as the current one lands.
// ---------------------------------------------------------------------------
static void start_generation(AppState& app)
{
    app.generating = true;
    app.dirty      = false;

    const NoiseOptions opts = app.opts;
    PendingResult*     out  = &app.pending;
    app.worker.submit([opts, out] {
        using clock = std::chrono::steady_clock;
        const auto t0 = clock::now();

        PixelBuffer buf;
        NoiseStatus st = generate_noise(opts, buf);
        const double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();

        std::lock_guard<std::mutex> lock(out->mtx);
        out->buf    = std::move(buf);
        out->status = std::move(st);
        out->gen_ms = ms;
        out->ready  = true;
    });
}

static void collect_generation(AppState& app)
{
    {
        std::lock_guard<std::mutex> lock(app.pending.mtx);
        if (!app.pending.ready) return;
        app.pending.ready = false;
        app.gen_status    = std::move(app.pending.status);
        app.gen_ms        = app.pending.gen_ms;
        if (app.gen_status.ok())
            app.pbuf = std::move(app.pending.buf);
    }
    app.generating = false;

    if (app.gen_status.ok())
        app.preview_tex.upload(app.pbuf);
    else
        fprintf(stderr, "generation failed: %s: %s\n",
                noise_error_name(app.gen_status.code), app.gen_status.message.c_str());
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int, char*[])
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "NoiseSmith",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 800,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename  = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    init_presets();

    // Owns GL textures, so it must go before the GL context does.
    auto app = std::make_unique<AppState>();

    bool running = true;
    while (running) {
        // Wake at least every 16 ms while a job is in flight so its result
        // shows up promptly; otherwise idle until input arrives.
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, app->generating ? 16 : 50)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        collect_generation(*app);
        if (app->dirty && !app->generating)
            start_generation(*app);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw     = static_cast<float>(win_w);
        const float fh     = static_cast<float>(win_h);
        const float menu_h = ImGui::GetFrameHeight();

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Export Texture", "Ctrl+S")) {
                    app->show_export = true;
                    app->exp_done    = false;
                    app->exp_msg.clear();
                }
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Seed")) {
                if (ImGui::MenuItem("Shuffle", "Space")) {
                    app->opts.seed = make_random_seed();
                    app->dirty     = true;
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app->show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl) {
            app->show_export = true;
            app->exp_done    = false;
            app->exp_msg.clear();
        }
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app->show_about = true;
        if (!io.WantTextInput && ImGui::IsKeyPressed(ImGuiKey_Space, false)) {
            app->opts.seed = make_random_seed();
            app->dirty     = true;
        }

        draw_side_panel(*app, menu_h, fh);
        draw_preview(*app, PANEL_WIDTH, menu_h,
                     fw - PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT);
        draw_status_bar(*app, fw, fh);
        draw_export_dialog(*app);
        draw_about_dialog(*app);

        // -------------------------------------------------------------------
        // Render
        // -------------------------------------------------------------------
        ImGui::Render();
        glViewport(0, 0, win_w, win_h);
        glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    app.reset();  // joins the worker, then frees the textures

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
