#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "noise_options.hpp"
#include "pixel_buffer.hpp"
#include "thread_pool.hpp"

#include <cstdint>
#include <mutex>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper: the render-to-surface end of the export path
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    // NEAREST filtering keeps cell edges crisp when the preview is zoomed.
    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, nw, nh, 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    // Rows are tightly packed RGBA8, so the default unpack alignment of 4 fits.
    void upload(const PixelBuffer& buf) {
        ensure(buf.width, buf.height);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.bytes.data());
    }

    ImTextureID imgui_id() const {
        return (ImTextureID)(intptr_t)id;
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// ---------------------------------------------------------------------------
// Result handed back from the generation worker
// ---------------------------------------------------------------------------
struct PendingResult {
    std::mutex  mtx;
    bool        ready   = false;
    PixelBuffer buf;
    NoiseStatus status;
    double      gen_ms  = 0.0;
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    NoiseOptions opts;
    PixelBuffer  pbuf;             // last finished texture, as shown
    NoiseStatus  gen_status;       // status of the last finished generation
    bool         dirty      = true;
    bool         generating = false;
    double       gen_ms     = 0.0;

    // Free-text tint field; the colour picker and this stay in sync.
    char         tint_text[32] = "#ffffff";
    int          preset_sel    = -1;

    // Preview
    float        zoom          = 1.0f;
    bool         checkerboard  = true;

    // Dialog flags
    bool         show_about    = false;
    bool         show_export   = false;

    // Export dialog state
    int          exp_fmt       = 0;    // 0=PNG, 1=JXL, 2=data URL to clipboard
    bool         exp_done      = false;
    std::string  exp_msg;
    std::string  exp_saved_name;

    GlTex         preview_tex;
    PendingResult pending;

    // Declared last so it is destroyed first: its worker writes into pending.
    ThreadPool    worker{1};
};
