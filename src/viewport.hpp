#pragma once

#include <algorithm>
#include <climits>
#include <cmath>

// Plane width (in complex units) visible across the image at zoom 1.0.
// Default framing shows re in [-2, 1] around center (-0.5, 0).
constexpr double DEFAULT_PLANE_WIDTH = 3.0;
constexpr double DEFAULT_CENTER_RE   = -0.5;
constexpr double DEFAULT_CENTER_IM   =  0.0;

enum class ConfigError {
    None                  = 0,
    InvalidViewport       = 1,  // width/height <= 0, or scale not positive and finite
    IterationBudgetTooLow = 2,  // max_iterations <= 0
    InvalidBound          = 3,  // escape radius not positive and finite
    InvalidColorMapping   = 4,  // cycle length <= 0 or offset outside [0, 1)
};

inline const char* config_error_message(ConfigError err)
{
    switch (err) {
        case ConfigError::None:
            return "ok";
        case ConfigError::InvalidViewport:
            return "invalid viewport: width and height must be > 0 and scale must be a positive finite number";
        case ConfigError::IterationBudgetTooLow:
            return "iteration budget too low: max iterations must be > 0";
        case ConfigError::InvalidBound:
            return "invalid escape bound: must be a positive finite number";
        case ConfigError::InvalidColorMapping:
            return "invalid color mapping: cycle length must be > 0 and offset in [0, 1)";
    }
    return "unknown error";
}

struct PlanePoint {
    double re = 0.0;
    double im = 0.0;
};

struct Viewport {
    double center_re = DEFAULT_CENTER_RE;
    double center_im = DEFAULT_CENTER_IM;
    double scale     = DEFAULT_PLANE_WIDTH / 800.0;  // complex-plane units per pixel
    int    width     = 800;
    int    height    = 600;
};

// Default framing for an image of the given size.
inline Viewport default_viewport(int width, int height)
{
    Viewport vp;
    vp.width  = width;
    vp.height = height;
    vp.scale  = width > 0 ? DEFAULT_PLANE_WIDTH / width : 0.0;
    return vp;
}

inline ConfigError validate(const Viewport& vp)
{
    if (vp.width <= 0 || vp.height <= 0)
        return ConfigError::InvalidViewport;
    if (!std::isfinite(vp.scale) || vp.scale <= 0.0)
        return ConfigError::InvalidViewport;
    if (!std::isfinite(vp.center_re) || !std::isfinite(vp.center_im))
        return ConfigError::InvalidViewport;
    return ConfigError::None;
}

// ---------------------------------------------------------------------------
// Pixel <-> plane mapping
//
// Pixel (w/2, h/2) sits exactly on the center. The span divisor is the image
// size itself, so a 1x1 image maps pixel 0 to center - scale/2.
// ---------------------------------------------------------------------------
inline PlanePoint map_pixel(double px, double py, const Viewport& vp)
{
    return { vp.center_re + (px - vp.width  * 0.5) * vp.scale,
             vp.center_im + (py - vp.height * 0.5) * vp.scale };
}

inline void plane_to_pixel(const PlanePoint& p, const Viewport& vp,
                           double& px, double& py)
{
    px = (p.re - vp.center_re) / vp.scale + vp.width  * 0.5;
    py = (p.im - vp.center_im) / vp.scale + vp.height * 0.5;
}

// Magnification relative to the default framing at the same width.
inline double zoom_level(const Viewport& vp)
{
    return DEFAULT_PLANE_WIDTH / (vp.scale * vp.width);
}

// Scale that realises `zoom` for an image `width` pixels wide.
inline double scale_for_zoom(double zoom, int width)
{
    return DEFAULT_PLANE_WIDTH / (zoom * width);
}

// ---------------------------------------------------------------------------
// Zoom / pan. Every operation returns a new Viewport; nothing is mutated in
// place, so a render pass can keep reading the one it started with.
// factor > 1 zooms in (scale shrinks), factor < 1 zooms out.
// ---------------------------------------------------------------------------

// `anchor` keeps its pixel position (mouse-wheel zoom).
inline Viewport zoom_about(const Viewport& vp, const PlanePoint& anchor, double factor)
{
    Viewport out = vp;
    out.scale     = vp.scale / factor;
    out.center_re = anchor.re + (vp.center_re - anchor.re) / factor;
    out.center_im = anchor.im + (vp.center_im - anchor.im) / factor;
    return out;
}

// Recenter on `point`, then zoom.
inline Viewport zoom_at(const Viewport& vp, const PlanePoint& point, double factor)
{
    Viewport out = vp;
    out.center_re = point.re;
    out.center_im = point.im;
    out.scale     = vp.scale / factor;
    return out;
}

inline Viewport zoom_at_pixel(const Viewport& vp, double px, double py, double factor)
{
    return zoom_at(vp, map_pixel(px, py, vp), factor);
}

// Shift the view by a pixel delta; positive dx moves the view right.
inline Viewport pan(const Viewport& vp, double dx_px, double dy_px)
{
    Viewport out = vp;
    out.center_re += dx_px * vp.scale;
    out.center_im += dy_px * vp.scale;
    return out;
}

// Fit the pixel box (x0,y0)-(x1,y1). The larger of the width and height ratios
// sets the new scale, so the whole box stays visible; boxes narrower than 2 px in either direction leave the view unchanged.
inline Viewport zoom_to_box(const Viewport& vp, double x0, double y0, double x1, double y1)
{
    const double bx0 = std::min(x0, x1), bx1 = std::max(x0, x1);
    const double by0 = std::min(y0, y1), by1 = std::max(y0, y1);
    const double bw  = bx1 - bx0;
    const double bh  = by1 - by0;
    if (bw < 2.0 || bh < 2.0)
        return vp;

    const PlanePoint mid = map_pixel(bx0 + bw * 0.5, by0 + bh * 0.5, vp);
    Viewport out = vp;
    out.center_re = mid.re;
    out.center_im = mid.im;
    out.scale     = vp.scale * std::max(bw / vp.width, bh / vp.height);
    return out;
}

// Same center, new pixel dimensions. The visible plane width is preserved.
inline Viewport resized(const Viewport& vp, int width, int height)
{
    Viewport out = vp;
    if (width > 0 && vp.width > 0)
        out.scale = vp.scale * vp.width / width;
    out.width  = width;
    out.height = height;
    return out;
}

// Iteration budget grown with magnification: base * (1 + 2*log10(zoom)),
// never below base and saturating at INT_MAX.
inline int detail_iterations(int base, double zoom)
{
    if (!(zoom > 1.0))
        return base;
    const double mult = std::floor(1.0 + 2.0 * std::log10(zoom));
    const double grown = base * std::max(1.0, mult);
    if (!(grown < static_cast<double>(INT_MAX)))
        return INT_MAX;
    return static_cast<int>(grown);
}
