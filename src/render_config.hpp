#pragma once

#include "renderer.hpp"

#include <cstdio>
#include <string>

// Command-line configuration of the mandelzoom tool, before validation.
struct RenderConfig {
    double       center_re   = DEFAULT_CENTER_RE;
    double       center_im   = DEFAULT_CENTER_IM;
    double       scale       = 0.0;   // > 0 overrides zoom
    double       zoom        = 1.0;
    int          width       = 800;
    int          height      = 600;
    int          max_iter    = 256;
    double       bound       = DEFAULT_BOUND;
    bool         auto_iter   = false;
    std::string  palette     = "classic";
    std::string  stops;               // non-empty selects a custom palette
    ColorMapping mapping;
    int          threads     = 0;     // 0 = hardware concurrency
    bool         no_avx      = false;
    std::string  output      = "mandelbrot.png";
    int          frames      = 0;     // > 0 renders a zoom sequence
    double       zoom_factor = 1.1;
    bool         benchmark   = false;
    bool         quiet       = false;
    bool         help        = false;
};

// Parses argv with getopt_long. Returns an empty string on success, or an
// error message. Not reentrant (getopt keeps global state).
std::string parse_args(int argc, char* argv[], RenderConfig& cfg);

// Resolves the palette and viewport and validates the result. Returns an
// empty string on success, or an error message.
std::string build_request(const RenderConfig& cfg, RenderRequest& out);

void print_usage(FILE* out, const char* prog);
