#pragma once

#include "escape_time.hpp"

#include <cstdint>
#include <string>
#include <vector>

static constexpr int LUT_SIZE = 1024;

// Built-in palettes first, Custom last. PALETTE_COUNT counts the built-ins.
enum class PaletteKind {
    Grayscale = 0,
    Rainbow   = 1,  // HSV hue wheel, full saturation and value
    Fire      = 2,
    Ice       = 3,
    Classic   = 4,  // blue-gold, UltraFractal-inspired
    Custom    = 5,
};
static constexpr int PALETTE_COUNT = 5;

constexpr uint32_t INTERIOR_COLOR = 0xFF000000u;  // opaque black

// Pixel layout: 0xAABBGGRR, i.e. bytes R, G, B, A in memory on little-endian.
inline uint32_t pack_rgb(uint8_t r, uint8_t g, uint8_t b)
{
    return 0xFF000000u
         | (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(g) <<  8)
         |  static_cast<uint32_t>(r);
}

inline uint8_t red_of(uint32_t px)   { return static_cast<uint8_t>(px        & 0xFFu); }
inline uint8_t green_of(uint32_t px) { return static_cast<uint8_t>((px >>  8) & 0xFFu); }
inline uint8_t blue_of(uint32_t px)  { return static_cast<uint8_t>((px >> 16) & 0xFFu); }
inline uint8_t alpha_of(uint32_t px) { return static_cast<uint8_t>((px >> 24) & 0xFFu); }

struct ColorStop { float t; uint8_t r, g, b; };

// Immutable after construction: the lookup table is built once and only read,
// so one Palette can be shared by every render worker.
class Palette {
public:
    Palette();  // Classic

    static Palette builtin(PaletteKind kind);

    // Throws std::invalid_argument unless there are >= 2 stops with
    // non-decreasing t inside [0, 1].
    static Palette custom(std::vector<ColorStop> stops);

    PaletteKind kind() const { return pal_kind; }
    const char* name() const;
    const std::vector<ColorStop>& stops() const { return pal_stops; }

    // t in [0, 1]; linear interpolation between neighbouring table entries.
    uint32_t sample(double t) const;

private:
    Palette(PaletteKind kind, std::vector<ColorStop> stops);

    PaletteKind            pal_kind = PaletteKind::Classic;
    std::vector<ColorStop> pal_stops;
    std::vector<uint32_t>  lut;
};

const char* palette_name(PaletteKind kind);

// Case-insensitive lookup of a built-in palette name. Returns false when the
// name is unknown.
bool palette_from_name(const std::string& name, PaletteKind& out);

// Parse "t:RRGGBB,t:RRGGBB,..." (t in [0,1], ascending, '#' prefix optional).
// Returns an empty string on success, or an error message.
std::string parse_color_stops(const std::string& text, std::vector<ColorStop>& out);

// ---------------------------------------------------------------------------
// Color mapping
// ---------------------------------------------------------------------------
enum class ColorScale {
    Cyclic      = 0,  // mirrored sweep every cycle_length iterations
    Linear      = 1,  // whole budget spans the palette once
    Logarithmic = 2,  // mirrored sweep in log2(1 + v)
};

struct ColorMapping {
    ColorScale scale        = ColorScale::Cyclic;
    double     cycle_length = 64.0;  // smooth iterations per palette sweep
    double     offset       = 0.0;   // [0, 1), shifts which color lands at v = 0
};

bool color_scale_from_name(const std::string& name, ColorScale& out);
const char* color_scale_name(ColorScale scale);

// Normalized palette position for a continuous escape value v = count + fraction.
double palette_position(double v, const ColorMapping& mapping, int max_iter);

// Map an iteration result to a packed RGBA pixel. Interior points are black;
// escaped points interpolate the palette, so the color is continuous in
// count + smoothing_fraction.
inline uint32_t colorize(const IterationResult& r, const Palette& palette,
                         const ColorMapping& mapping, int max_iter)
{
    if (!r.escaped)
        return INTERIOR_COLOR;
    return palette.sample(palette_position(smooth_value(r), mapping, max_iter));
}
