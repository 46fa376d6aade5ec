#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "background_renderer.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

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

    void upload(const RasterBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// ---------------------------------------------------------------------------
// All mutable viewer state. The Viewport here is the one the *next* render
// will use; the background renderer works on its own copy.
// ---------------------------------------------------------------------------
struct ViewerState {
    Viewport     vp;
    int          base_iter   = 256;
    bool         auto_iter   = true;
    int          palette_sel = static_cast<int>(PaletteKind::Classic);
    ColorMapping mapping;
    std::vector<Palette> palettes;   // one per built-in kind, built once

    BackgroundRenderer renderer;
    bool        dirty          = true;   // view changed, needs a new request
    bool        interacted     = false;  // input moved the view this frame
    bool        preview_shown  = false;  // last submitted request was a preview
    FrameInfo   shown;                   // frame currently on screen
    RasterBuffer frame;

    // Dialog flags
    bool        show_about  = false;
    bool        show_export = false;

    // Export dialog state
    int         exp_scale    = 0;      // 0=1x, 1=2x, 2=4x
    int         exp_fmt      = 0;      // 0=PNG, 1=JXL
    bool        exp_done     = false;
    std::string exp_msg;
    std::string exp_saved_name;

    // Thread count selector (0 = Auto)
    int  thread_sel = 0;
    bool use_avx2   = true;

    // Navigation
    bool     pressing        = false;  // left button down inside the render area
    bool     panning         = false;  // ... and moved far enough to count as a drag
    ImVec2   pan_start_mouse = {};
    Viewport pan_start_vp    = {};

    bool   zoom_boxing = false;
    ImVec2 zbox_start  = {};
    ImVec2 zbox_end    = {};

    GlTex render_tex;
};

// Request for the current view. auto_iter grows the budget with zoom.
inline RenderRequest current_request(const ViewerState& app)
{
    RenderRequest req;
    req.viewport = app.vp;
    req.max_iter = app.auto_iter ? detail_iterations(app.base_iter, zoom_level(app.vp))
                                 : app.base_iter;
    req.palette  = app.palettes[static_cast<size_t>(app.palette_sel)];
    req.mapping  = app.mapping;
    return req;
}

// Coarser previews the deeper the zoom, while the view is moving.
inline int preview_step_for(const Viewport& vp)
{
    const double z = zoom_level(vp);
    if (z < 100.0)  return 2;
    if (z < 1000.0) return 3;
    return 4;
}
