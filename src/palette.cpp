#include "palette.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

static const char* const g_palette_names[PALETTE_COUNT] = {
    "grayscale",
    "rainbow",
    "fire",
    "ice",
    "classic",
};

// ---------------------------------------------------------------------------
// Table builders: one per palette family
// ---------------------------------------------------------------------------
static void build_stops_lut(std::vector<uint32_t>& lut, const std::vector<ColorStop>& stops)
{
    const int n = static_cast<int>(stops.size());
    lut.resize(LUT_SIZE);
    for (int i = 0; i < LUT_SIZE; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(LUT_SIZE - 1);

        // Find the segment [stops[seg], stops[seg+1]] that contains t.
        int seg = n - 2;
        for (int s = 0; s < n - 1; ++s) {
            if (t <= stops[s + 1].t) { seg = s; break; }
        }
        const ColorStop& a = stops[seg];
        const ColorStop& b = stops[seg + 1];
        const float span = b.t - a.t;
        const float f    = (span > 0.0f) ? (t - a.t) / span : 0.0f;
        const float cf   = std::max(0.0f, std::min(1.0f, f));

        const uint8_t r  = static_cast<uint8_t>(std::lround(a.r + cf * (static_cast<float>(b.r) - a.r)));
        const uint8_t g  = static_cast<uint8_t>(std::lround(a.g + cf * (static_cast<float>(b.g) - a.g)));
        const uint8_t bv = static_cast<uint8_t>(std::lround(a.b + cf * (static_cast<float>(b.b) - a.b)));
        lut[i] = pack_rgb(r, g, bv);
    }
}

// h in degrees [0, 360), s and v in [0, 1].
static uint32_t hsv_to_rgb(double h, double s, double v)
{
    const double c       = v * s;
    const double h_prime = std::fmod(h, 360.0) / 60.0;
    const double x       = c * (1.0 - std::abs(std::fmod(h_prime, 2.0) - 1.0));
    const double m       = v - c;

    double r = 0.0, g = 0.0, b = 0.0;
    switch (static_cast<int>(h_prime)) {
        case 0:  r = c; g = x; b = 0; break;
        case 1:  r = x; g = c; b = 0; break;
        case 2:  r = 0; g = c; b = x; break;
        case 3:  r = 0; g = x; b = c; break;
        case 4:  r = x; g = 0; b = c; break;
        default: r = c; g = 0; b = x; break;
    }
    return pack_rgb(static_cast<uint8_t>(std::lround((r + m) * 255.0)),
                    static_cast<uint8_t>(std::lround((g + m) * 255.0)),
                    static_cast<uint8_t>(std::lround((b + m) * 255.0)));
}

// The sweep stops just short of 360 degrees so t = 0 and t = 1 stay distinct hues.
static void build_hue_lut(std::vector<uint32_t>& lut)
{
    lut.resize(LUT_SIZE);
    for (int i = 0; i < LUT_SIZE; ++i) {
        const double hue = 360.0 * static_cast<double>(i) / static_cast<double>(LUT_SIZE);
        lut[i] = hsv_to_rgb(hue, 1.0, 1.0);
    }
}

// ---------------------------------------------------------------------------
// Palette definitions
// ---------------------------------------------------------------------------
static std::vector<ColorStop> builtin_stops(PaletteKind kind)
{
    switch (kind) {
        case PaletteKind::Grayscale:
            return {
                {0.0f,   0,   0,   0},
                {1.0f, 255, 255, 255},
            };
        // black -> dark-red -> red -> orange -> yellow -> white
        case PaletteKind::Fire:
            return {
                {0.000f,   0,   0,   0},
                {0.250f, 128,   0,   0},
                {0.500f, 255,   0,   0},
                {0.750f, 255, 128,   0},
                {0.875f, 255, 255,   0},
                {1.000f, 255, 255, 255},
            };
        // black -> dark-blue -> blue -> cyan -> white
        case PaletteKind::Ice:
            return {
                {0.000f,   0,   0,   0},
                {0.250f,   0,   0, 128},
                {0.500f,   0,  64, 255},
                {0.750f,   0, 200, 255},
                {1.000f, 255, 255, 255},
            };
        case PaletteKind::Classic:
            return {
                {0.0000f,   0,   7, 100},
                {0.1600f,  32, 107, 203},
                {0.4200f, 237, 255, 255},
                {0.6425f, 255, 170,   0},
                {0.8575f,   0,   2,   0},
                {1.0000f,   0,   7, 100},
            };
        case PaletteKind::Rainbow:
        case PaletteKind::Custom:
            break;
    }
    return {};
}

Palette::Palette()
    : Palette(PaletteKind::Classic, builtin_stops(PaletteKind::Classic))
{
}

Palette::Palette(PaletteKind kind, std::vector<ColorStop> stops)
    : pal_kind(kind), pal_stops(std::move(stops))
{
    if (kind == PaletteKind::Rainbow)
        build_hue_lut(lut);
    else
        build_stops_lut(lut, pal_stops);
}

Palette Palette::builtin(PaletteKind kind)
{
    if (kind == PaletteKind::Custom)
        throw std::invalid_argument("Palette::builtin: Custom palettes need color stops");
    return Palette(kind, builtin_stops(kind));
}

Palette Palette::custom(std::vector<ColorStop> stops)
{
    if (stops.size() < 2)
        throw std::invalid_argument("custom palette needs at least 2 color stops");
    for (size_t i = 0; i < stops.size(); ++i) {
        const float t = stops[i].t;
        if (!(t >= 0.0f && t <= 1.0f))
            throw std::invalid_argument("color stop position outside [0, 1]");
        if (i > 0 && t < stops[i - 1].t)
            throw std::invalid_argument("color stop positions must be ascending");
    }
    return Palette(PaletteKind::Custom, std::move(stops));
}

const char* Palette::name() const
{
    return palette_name(pal_kind);
}

uint32_t Palette::sample(double t) const
{
    if (!(t > 0.0)) return lut.front();
    if (t >= 1.0)   return lut.back();

    const double pos = t * (LUT_SIZE - 1);
    const int    i   = std::min(static_cast<int>(pos), LUT_SIZE - 2);
    const double f   = pos - i;
    const uint32_t a = lut[i];
    const uint32_t b = lut[i + 1];
    auto mix = [f](uint8_t ca, uint8_t cb) {
        return static_cast<uint8_t>(std::lround(ca + f * (static_cast<double>(cb) - ca)));
    };
    return pack_rgb(mix(red_of(a),   red_of(b)),
                    mix(green_of(a), green_of(b)),
                    mix(blue_of(a),  blue_of(b)));
}

const char* palette_name(PaletteKind kind)
{
    const int k = static_cast<int>(kind);
    if (k >= 0 && k < PALETTE_COUNT)
        return g_palette_names[k];
    return "custom";
}

static std::string to_lower(const std::string& s)
{
    std::string out = s;
    for (char& ch : out)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

bool palette_from_name(const std::string& name, PaletteKind& out)
{
    const std::string key = to_lower(name);
    for (int k = 0; k < PALETTE_COUNT; ++k) {
        if (key == g_palette_names[k]) {
            out = static_cast<PaletteKind>(k);
            return true;
        }
    }
    return false;
}

std::string parse_color_stops(const std::string& text, std::vector<ColorStop>& out)
{
    std::vector<ColorStop> stops;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find(',', pos);
        if (end == std::string::npos) end = text.size();
        const std::string item = text.substr(pos, end - pos);
        pos = end + 1;

        const size_t colon = item.find(':');
        if (colon == std::string::npos)
            return "color stop '" + item + "' is not of the form t:RRGGBB";

        const std::string t_str   = item.substr(0, colon);
        std::string       hex_str = item.substr(colon + 1);
        if (!hex_str.empty() && hex_str[0] == '#')
            hex_str.erase(0, 1);

        char* t_end = nullptr;
        const double t = std::strtod(t_str.c_str(), &t_end);
        if (t_str.empty() || *t_end != '\0')
            return "bad color stop position '" + t_str + "'";
        if (!(t >= 0.0 && t <= 1.0))
            return "color stop position '" + t_str + "' outside [0, 1]";
        if (!stops.empty() && t < stops.back().t)
            return "color stop positions must be ascending";

        if (hex_str.size() != 6)
            return "bad color '" + hex_str + "', expected RRGGBB";
        for (char c : hex_str)
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                return "bad color '" + hex_str + "', expected RRGGBB";
        const unsigned long rgb = std::strtoul(hex_str.c_str(), nullptr, 16);

        stops.push_back({static_cast<float>(t),
                         static_cast<uint8_t>((rgb >> 16) & 0xFFu),
                         static_cast<uint8_t>((rgb >>  8) & 0xFFu),
                         static_cast<uint8_t>( rgb        & 0xFFu)});
        if (end == text.size()) break;
    }
    if (stops.size() < 2)
        return "custom palette needs at least 2 color stops";
    out = std::move(stops);
    return {};
}

// ---------------------------------------------------------------------------
// Color mapping
// ---------------------------------------------------------------------------
static const char* const g_scale_names[] = { "cyclic", "linear", "log" };

const char* color_scale_name(ColorScale scale)
{
    return g_scale_names[static_cast<int>(scale)];
}

bool color_scale_from_name(const std::string& name, ColorScale& out)
{
    const std::string key = to_lower(name);
    if (key == "cyclic")                               { out = ColorScale::Cyclic;      return true; }
    if (key == "linear")                               { out = ColorScale::Linear;      return true; }
    if (key == "log" || key == "logarithmic")          { out = ColorScale::Logarithmic; return true; }
    return false;
}

// Triangle wave over [0, 1]: 0 -> 1 -> 0 per unit of x. Keeps cyclic sweeps
// continuous for palettes whose two ends differ.
static double mirrored(double x)
{
    const double f = x - std::floor(x);
    return 1.0 - std::abs(2.0 * f - 1.0);
}

double palette_position(double v, const ColorMapping& mapping, int max_iter)
{
    switch (mapping.scale) {
        case ColorScale::Linear:
            if (max_iter <= 0) return 0.0;
            return std::max(0.0, std::min(1.0, v / max_iter + mapping.offset));
        case ColorScale::Logarithmic:
            return mirrored(std::log2(1.0 + std::max(v, 0.0))
                            / std::log2(1.0 + mapping.cycle_length)
                            + mapping.offset);
        case ColorScale::Cyclic:
            break;
    }
    return mirrored(v / mapping.cycle_length + mapping.offset);
}
