#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "viewer_state.hpp"
#include "export.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;
static const float DRAG_SLOP     = 4.0f;   // px of movement before a click becomes a pan

// ---------------------------------------------------------------------------
// Side panel
// ---------------------------------------------------------------------------
static void draw_side_panel(ViewerState& app, const ImGuiIO& io, float menu_h, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar           |
        ImGuiWindowFlags_NoScrollWithMouse);

    // --- View ---
    ImGui::TextDisabled("VIEW");
    ImGui::Separator();
    {
        double re = app.vp.center_re;
        double im = app.vp.center_im;
        ImGui::Text("re:"); ImGui::SameLine();
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::InputDouble("##cre", &re, 0.0, 0.0, "%.12f"))
            { app.vp.center_re = re; app.dirty = true; }
        ImGui::Text("im:"); ImGui::SameLine();
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::InputDouble("##cim", &im, 0.0, 0.0, "%.12f"))
            { app.vp.center_im = im; app.dirty = true; }
        ImGui::Text("zoom: %.4gx", zoom_level(app.vp));
        if (ImGui::Button("Reset view", ImVec2(-1.0f, 0.0f))) {
            app.vp    = default_viewport(app.vp.width, app.vp.height);
            app.dirty = true;
        }
    }

    // --- Iteration count ---
    ImGui::Spacing();
    ImGui::TextDisabled("ITERATIONS");
    ImGui::Separator();
    {
        int iter = app.base_iter;
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##iter", &iter, 16, 8192, "%d",
                             ImGuiSliderFlags_Logarithmic)) {
            app.base_iter = iter;
            app.dirty     = true;
        }
        if (ImGui::Checkbox("Grow with zoom", &app.auto_iter))
            app.dirty = true;
        if (app.auto_iter)
            ImGui::TextDisabled("effective: %d", current_request(app).max_iter);
    }

    // --- Palette ---
    ImGui::Spacing();
    ImGui::TextDisabled("PALETTE");
    ImGui::Separator();
    {
        const char* names[PALETTE_COUNT];
        for (int k = 0; k < PALETTE_COUNT; ++k)
            names[k] = palette_name(static_cast<PaletteKind>(k));
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##palette", &app.palette_sel, names, PALETTE_COUNT))
            app.dirty = true;
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f) {
            app.palette_sel = (app.palette_sel + (io.MouseWheel < 0.0f ? 1 : -1) + PALETTE_COUNT) % PALETTE_COUNT;
            app.dirty = true;
        }

        static const char* scales[] = { "Cyclic", "Linear", "Logarithmic" };
        int s = static_cast<int>(app.mapping.scale);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##scale", &s, scales, 3)) {
            app.mapping.scale = static_cast<ColorScale>(s);
            app.dirty = true;
        }

        ImGui::Text("Cycle");
        float cycle = static_cast<float>(app.mapping.cycle_length);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##cycle", &cycle, 4.0f, 1024.0f, "%.0f",
                               ImGuiSliderFlags_Logarithmic)) {
            app.mapping.cycle_length = cycle;
            app.dirty = true;
        }

        ImGui::Text("Offset");
        float offset = static_cast<float>(app.mapping.offset);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##offset", &offset, 0.0f, 0.999f, "%.3f")) {
            app.mapping.offset = offset;
            app.dirty = true;
        }
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Export dialog: renders synchronously at 1x/2x/4x of the current view.
// ---------------------------------------------------------------------------
static void draw_export_dialog(ViewerState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export Image##dlg");
        app.show_export = false;
    }
    if (!ImGui::BeginPopupModal("Export Image##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    ImGui::TextDisabled("FORMAT");
    ImGui::Separator();
    ImGui::RadioButton("PNG", &app.exp_fmt, 0);
    if (jxl_available()) {
        ImGui::SameLine();
        ImGui::RadioButton("JPEG XL (lossless)", &app.exp_fmt, 1);
    }

    ImGui::Spacing();
    ImGui::TextDisabled("RESOLUTION");
    ImGui::Separator();
    char buf1[48], buf2[48], buf4[48];
    std::snprintf(buf1, sizeof(buf1), "1x  (%d x %d)", app.vp.width,     app.vp.height);
    std::snprintf(buf2, sizeof(buf2), "2x  (%d x %d)", app.vp.width * 2, app.vp.height * 2);
    std::snprintf(buf4, sizeof(buf4), "4x  (%d x %d)", app.vp.width * 4, app.vp.height * 4);
    ImGui::RadioButton(buf1, &app.exp_scale, 0);
    ImGui::RadioButton(buf2, &app.exp_scale, 1);
    ImGui::RadioButton(buf4, &app.exp_scale, 2);

    ImGui::Spacing();
    ImGui::TextDisabled("OUTPUT");
    ImGui::Separator();

    const char* ext = (app.exp_fmt == 1 && jxl_available()) ? "jxl" : "png";
    std::time_t t = std::time(nullptr);
    std::tm* tm = std::localtime(&t);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);
    const std::string filename = std::string("mandelbrot_") + ts + "." + ext;
    ImGui::Text("%s", filename.c_str());

    if (!app.exp_done) {
        ImGui::Spacing();
        if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
            app.exp_saved_name = filename;
            const int mult = 1 << app.exp_scale;
            RenderRequest req = current_request(app);
            req.viewport = resized(req.viewport, app.vp.width * mult, app.vp.height * mult);

            CpuRenderer xr(app.renderer.thread_count());
            xr.set_avx2(app.use_avx2);
            RasterBuffer xbuf;
            try {
                xr.render(req, xbuf);
                app.exp_msg = export_image(app.exp_saved_name, xbuf, describe_request(req));
            } catch (const std::exception& e) {
                app.exp_msg = e.what();
            }
            if (!app.exp_msg.empty())
                std::fprintf(stderr, "export failed: %s\n", app.exp_msg.c_str());
            app.exp_done = true;
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

static void draw_about_dialog(ViewerState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (!ImGui::BeginPopupModal("About##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    ImGui::Text("mandelzoom viewer");
    ImGui::Separator();
    ImGui::Spacing();
    ImGui::TextDisabled("Wheel: zoom at cursor      Click: zoom 2x here (Shift: out)");
    ImGui::TextDisabled("Drag: pan                  Right-drag: zoom box");
    ImGui::TextDisabled("Arrows: pan   +/-: zoom   PgUp/PgDn: iterations");
    ImGui::TextDisabled("P / Shift+P: palette   R: reset   Ctrl+S: export");
    ImGui::Spacing();
    ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng%s",
                        jxl_available() ? ", libjxl" : "");
    ImGui::Spacing();
    if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
        ImGui::CloseCurrentPopup();
    ImGui::EndPopup();
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
        "mandelzoom",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 720,
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

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    // Owned by a unique_ptr so its GL texture dies before the context does.
    auto app_ptr = std::make_unique<ViewerState>();
    ViewerState& app = *app_ptr;
    for (int k = 0; k < PALETTE_COUNT; ++k)
        app.palettes.push_back(Palette::builtin(static_cast<PaletteKind>(k)));
    app.use_avx2 = app.renderer.avx2_active();

    auto update_title = [&]() {
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "mandelzoom  (%.6f, %.6f)  [zoom: %.4gx]",
                      app.shown.viewport.center_re, app.shown.viewport.center_im,
                      zoom_level(app.shown.viewport));
        SDL_SetWindowTitle(window, tbuf);
    };

    bool running = true;
    while (running) {
        // Block for at most 15 ms while idle; poll quickly while a render is in flight.
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, app.renderer.busy() ? 5 : 15)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw       = static_cast<float>(win_w);
        const float fh       = static_cast<float>(win_h);
        const float menu_h   = ImGui::GetFrameHeight();
        const float render_x = PANEL_WIDTH;
        const float render_y = menu_h;
        const float render_w = fw - PANEL_WIDTH;
        const float render_h = fh - menu_h - STATUS_HEIGHT;
        const int   irw      = static_cast<int>(render_w);
        const int   irh      = static_cast<int>(render_h);

        if (irw > 0 && irh > 0 && (irw != app.vp.width || irh != app.vp.height)) {
            app.vp    = resized(app.vp, irw, irh);
            app.dirty = true;
        }
        app.interacted = false;

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Export Image", "Ctrl+S")) {
                    app.show_export = true;
                    app.exp_done    = false;
                    app.exp_msg.clear();
                }
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Reset View", "R")) {
                    app.vp    = default_viewport(app.vp.width, app.vp.height);
                    app.dirty = true;
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Threads")) {
                const int hw = app.renderer.hw_concurrency();
                char buf[32];
                snprintf(buf, sizeof(buf), "Auto (%d)", hw);
                if (ImGui::MenuItem(buf, nullptr, app.thread_sel == 0)) {
                    app.thread_sel = 0;
                    app.renderer.set_thread_count(0);
                    app.dirty = true;
                }
                ImGui::Separator();
                for (int i = 1; i <= hw; ++i) {
                    snprintf(buf, sizeof(buf), "%d", i);
                    if (ImGui::MenuItem(buf, nullptr, app.thread_sel == i)) {
                        app.thread_sel = i;
                        app.renderer.set_thread_count(i);
                        app.dirty = true;
                    }
                }
                ImGui::Separator();
                if (ImGui::MenuItem("AVX2", nullptr, &app.use_avx2)) {
                    app.renderer.set_avx2(app.use_avx2);
                    app.dirty = true;
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app.show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl) {
            app.show_export = true;
            app.exp_done    = false;
            app.exp_msg.clear();
        }
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app.show_about = true;
        if (!io.WantTextInput) {
            if (ImGui::IsKeyPressed(ImGuiKey_R)) {
                app.vp    = default_viewport(app.vp.width, app.vp.height);
                app.dirty = true;
            }
            const PlanePoint mid{app.vp.center_re, app.vp.center_im};
            if (ImGui::IsKeyPressed(ImGuiKey_Equal) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) {
                app.vp = zoom_about(app.vp, mid, 1.5);  app.interacted = true;
            }
            if (ImGui::IsKeyPressed(ImGuiKey_Minus) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract)) {
                app.vp = zoom_about(app.vp, mid, 1.0 / 1.5);  app.interacted = true;
            }
            // Arrow keys: pan by 10% of view width
            const double step = app.vp.width * 0.1;
            if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow,  true))
                { app.vp = pan(app.vp, -step, 0.0);  app.interacted = true; }
            if (ImGui::IsKeyPressed(ImGuiKey_RightArrow, true))
                { app.vp = pan(app.vp,  step, 0.0);  app.interacted = true; }
            if (ImGui::IsKeyPressed(ImGuiKey_UpArrow,    true))
                { app.vp = pan(app.vp, 0.0, -step);  app.interacted = true; }
            if (ImGui::IsKeyPressed(ImGuiKey_DownArrow,  true))
                { app.vp = pan(app.vp, 0.0,  step);  app.interacted = true; }
            // PageUp/Down: double or halve iteration count
            if (ImGui::IsKeyPressed(ImGuiKey_PageUp))
                { app.base_iter = std::min(app.base_iter * 2, 8192);  app.dirty = true; }
            if (ImGui::IsKeyPressed(ImGuiKey_PageDown))
                { app.base_iter = std::max(app.base_iter / 2, 16);    app.dirty = true; }
            // P / Shift+P: cycle palette forward / backward
            if (ImGui::IsKeyPressed(ImGuiKey_P)) {
                const int dir = io.KeyShift ? -1 : 1;
                app.palette_sel = (app.palette_sel + dir + PALETTE_COUNT) % PALETTE_COUNT;
                app.dirty = true;
            }
        }

        draw_side_panel(app, io, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
        ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
        ImGui::Begin("##render", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar);
        ImGui::PopStyleVar();

        if (app.render_tex.id)
            ImGui::Image(app.render_tex.imgui_id(), ImVec2(render_w, render_h));

        const bool render_hovered = ImGui::IsWindowHovered();
        const double mx = io.MousePos.x - render_x;
        const double my = io.MousePos.y - render_y;

        // Mouse wheel zoom (centered on cursor)
        if (render_hovered && io.MouseWheel != 0.0f) {
            const double factor = (io.MouseWheel > 0.0f) ? 1.25 : (1.0 / 1.25);
            app.vp = zoom_about(app.vp, map_pixel(mx, my, app.vp), factor);
            app.interacted = true;
        }

        // Left button: click zooms 2x at the point, drag pans
        if (render_hovered &&
            ImGui::IsMouseClicked(ImGuiMouseButton_Left) && !app.zoom_boxing) {
            app.pressing        = true;
            app.panning         = false;
            app.pan_start_mouse = io.MousePos;
            app.pan_start_vp    = app.vp;
        }
        if (app.pressing) {
            const float dx = io.MousePos.x - app.pan_start_mouse.x;
            const float dy = io.MousePos.y - app.pan_start_mouse.y;
            if (ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
                if (!app.panning && std::abs(dx) + std::abs(dy) > DRAG_SLOP)
                    app.panning = true;
                if (app.panning) {
                    const Viewport moved = pan(app.pan_start_vp, -dx, -dy);
                    if (moved.center_re != app.vp.center_re || moved.center_im != app.vp.center_im) {
                        app.vp = moved;
                        app.interacted = true;
                    }
                }
            } else {
                if (!app.panning) {
                    const double factor = io.KeyShift ? 0.5 : 2.0;
                    app.vp = zoom_at_pixel(app.vp,
                                           app.pan_start_mouse.x - render_x,
                                           app.pan_start_mouse.y - render_y, factor);
                    app.dirty = true;
                }
                app.pressing = false;
                app.panning  = false;
            }
        }

        // Right-click drag: zoom box
        if (render_hovered &&
            ImGui::IsMouseClicked(ImGuiMouseButton_Right) && !app.pressing) {
            app.zoom_boxing = true;
            app.zbox_start  = io.MousePos;
            app.zbox_end    = io.MousePos;
        }
        if (app.zoom_boxing) {
            app.zbox_end = io.MousePos;
            ImDrawList* dl = ImGui::GetWindowDrawList();
            dl->AddRectFilled(app.zbox_start, app.zbox_end, IM_COL32(255, 255, 255, 20));
            dl->AddRect(app.zbox_start, app.zbox_end, IM_COL32(255, 255, 255, 200),
                        0.0f, 0, 1.5f);

            if (!ImGui::IsMouseDown(ImGuiMouseButton_Right)) {
                app.vp = zoom_to_box(app.vp,
                                     app.zbox_start.x - render_x, app.zbox_start.y - render_y,
                                     app.zbox_end.x   - render_x, app.zbox_end.y   - render_y);
                app.dirty       = true;
                app.zoom_boxing = false;
            }
        }

        ImGui::End();  // ##render

        // -------------------------------------------------------------------
        // Submit work: previews while the view moves, a full pass once it
        // settles. Each submit abandons whatever is still rendering.
        // -------------------------------------------------------------------
        if (app.interacted && validate(app.vp) == ConfigError::None) {
            app.renderer.submit(current_request(app), preview_step_for(app.vp));
            app.preview_shown = true;
            app.dirty         = false;
        } else if ((app.dirty || app.preview_shown) && validate(app.vp) == ConfigError::None) {
            app.renderer.submit(current_request(app), 1);
            app.preview_shown = false;
            app.dirty         = false;
        }

        FrameInfo info;
        if (app.renderer.poll(app.frame, &info)) {
            app.shown = info;
            app.render_tex.ensure(app.frame.width, app.frame.height);
            app.render_tex.upload(app.frame);
            update_title();
        }

        // -------------------------------------------------------------------
        // Status bar
        // -------------------------------------------------------------------
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
        ImGui::Text("x: %.12f   y: %.12f   zoom: %.4gx   iter: %d   %.0f ms%s  [%s  %dt]",
                    app.shown.viewport.center_re, app.shown.viewport.center_im,
                    zoom_level(app.shown.viewport), app.shown.max_iter,
                    app.shown.stats.milliseconds,
                    app.shown.preview_step > 1 ? " (preview)" : "",
                    app.renderer.avx2_active() ? "AVX2" : "scalar",
                    app.renderer.thread_count());
        ImGui::End();

        draw_export_dialog(app);
        draw_about_dialog(app);

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

    app_ptr.reset();   // stops the render worker, frees the texture

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
