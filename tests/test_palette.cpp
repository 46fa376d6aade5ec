#include "palette.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

static int channel_distance(uint32_t a, uint32_t b)
{
    return std::max({std::abs(red_of(a)   - red_of(b)),
                     std::abs(green_of(a) - green_of(b)),
                     std::abs(blue_of(a)  - blue_of(b))});
}

TEST(Palette, PackedLayoutIsRGBA)
{
    const uint32_t px = pack_rgb(0x12, 0x34, 0x56);
    EXPECT_EQ(px, 0xFF563412u);
    EXPECT_EQ(red_of(px), 0x12);
    EXPECT_EQ(green_of(px), 0x34);
    EXPECT_EQ(blue_of(px), 0x56);
    EXPECT_EQ(alpha_of(px), 0xFF);
}

TEST(Palette, BuiltinEndpointsMatchStops)
{
    const Palette gray = Palette::builtin(PaletteKind::Grayscale);
    EXPECT_EQ(gray.sample(0.0), pack_rgb(0, 0, 0));
    EXPECT_EQ(gray.sample(1.0), pack_rgb(255, 255, 255));

    const Palette fire = Palette::builtin(PaletteKind::Fire);
    EXPECT_EQ(fire.sample(1.0), pack_rgb(255, 255, 255));
    EXPECT_EQ(fire.sample(-3.0), fire.sample(0.0));
    EXPECT_EQ(fire.sample(7.0), fire.sample(1.0));
}

TEST(Palette, RainbowStartsRed)
{
    const Palette rainbow = Palette::builtin(PaletteKind::Rainbow);
    EXPECT_EQ(rainbow.sample(0.0), pack_rgb(255, 0, 0));
    EXPECT_EQ(rainbow.kind(), PaletteKind::Rainbow);
}

TEST(Palette, DefaultIsClassic)
{
    const Palette p;
    EXPECT_EQ(p.kind(), PaletteKind::Classic);
    EXPECT_STREQ(p.name(), "classic");
}

TEST(Palette, SamplesAreOpaque)
{
    for (int k = 0; k < PALETTE_COUNT; ++k) {
        const Palette p = Palette::builtin(static_cast<PaletteKind>(k));
        for (int i = 0; i <= 100; ++i)
            EXPECT_EQ(alpha_of(p.sample(i / 100.0)), 0xFF) << p.name();
    }
}

TEST(Palette, ColorIsContinuousInEscapeValue)
{
    ColorMapping cyclic;
    ColorMapping linear;
    linear.scale = ColorScale::Linear;
    ColorMapping logscale;
    logscale.scale = ColorScale::Logarithmic;
    logscale.offset = 0.3;

    for (int k = 0; k < PALETTE_COUNT; ++k) {
        const Palette p = Palette::builtin(static_cast<PaletteKind>(k));
        for (const ColorMapping& m : {cyclic, linear, logscale}) {
            uint32_t prev = p.sample(palette_position(0.0, m, 1000));
            for (int i = 1; i <= 100000; ++i) {
                const double   v   = i * 0.001;
                const uint32_t cur = p.sample(palette_position(v, m, 1000));
                ASSERT_LE(channel_distance(prev, cur), 4)
                    << p.name() << " " << color_scale_name(m.scale) << " v=" << v;
                prev = cur;
            }
        }
    }
}

TEST(Palette, PalettePositionStaysInUnitRange)
{
    ColorMapping m;
    for (ColorScale s : {ColorScale::Cyclic, ColorScale::Linear, ColorScale::Logarithmic}) {
        m.scale = s;
        for (double v = 0.0; v < 5000.0; v += 3.7) {
            const double t = palette_position(v, m, 4096);
            EXPECT_GE(t, 0.0);
            EXPECT_LE(t, 1.0);
        }
    }
}

TEST(Palette, InteriorPointsAreBlack)
{
    IterationResult inside;
    inside.escaped = false;
    inside.count   = 256;
    for (int k = 0; k < PALETTE_COUNT; ++k) {
        const Palette p = Palette::builtin(static_cast<PaletteKind>(k));
        EXPECT_EQ(colorize(inside, p, ColorMapping(), 256), INTERIOR_COLOR);
    }
}

TEST(Palette, NamesRoundTrip)
{
    for (int k = 0; k < PALETTE_COUNT; ++k) {
        const PaletteKind kind = static_cast<PaletteKind>(k);
        PaletteKind found = PaletteKind::Custom;
        ASSERT_TRUE(palette_from_name(palette_name(kind), found));
        EXPECT_EQ(found, kind);
    }
    PaletteKind found = PaletteKind::Custom;
    EXPECT_TRUE(palette_from_name("FIRE", found));
    EXPECT_EQ(found, PaletteKind::Fire);
    EXPECT_FALSE(palette_from_name("plasma", found));
    EXPECT_FALSE(palette_from_name("custom", found));
}

TEST(Palette, ColorScaleNames)
{
    ColorScale s = ColorScale::Cyclic;
    EXPECT_TRUE(color_scale_from_name("log", s));
    EXPECT_EQ(s, ColorScale::Logarithmic);
    EXPECT_TRUE(color_scale_from_name("Linear", s));
    EXPECT_EQ(s, ColorScale::Linear);
    EXPECT_FALSE(color_scale_from_name("sqrt", s));
}

TEST(Palette, ParseColorStops)
{
    std::vector<ColorStop> stops;
    ASSERT_EQ(parse_color_stops("0:000000,0.5:#ff8000,1:FFFFFF", stops), "");
    ASSERT_EQ(stops.size(), 3u);
    EXPECT_FLOAT_EQ(stops[1].t, 0.5f);
    EXPECT_EQ(stops[1].r, 0xFF);
    EXPECT_EQ(stops[1].g, 0x80);
    EXPECT_EQ(stops[1].b, 0x00);

    const Palette p = Palette::custom(stops);
    EXPECT_EQ(p.kind(), PaletteKind::Custom);
    EXPECT_STREQ(p.name(), "custom");
    EXPECT_EQ(p.sample(0.0), pack_rgb(0, 0, 0));
    EXPECT_EQ(p.sample(1.0), pack_rgb(255, 255, 255));
}

TEST(Palette, ParseColorStopsRejectsMalformedInput)
{
    std::vector<ColorStop> stops;
    EXPECT_NE(parse_color_stops("", stops), "");
    EXPECT_NE(parse_color_stops("0:000000", stops), "");
    EXPECT_NE(parse_color_stops("0:000000,1:fff", stops), "");
    EXPECT_NE(parse_color_stops("0:000000,x:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0:000000,1.5:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0.8:000000,0.2:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0:000000,1:gg0000", stops), "");
    EXPECT_TRUE(stops.empty());
}

TEST(Palette, ParseColorStopsNeedsSixHexDigits)
{
    std::vector<ColorStop> stops;
    EXPECT_NE(parse_color_stops("0:0x1234,1:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0:+12345,1:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0: 12345,1:ffffff", stops), "");
    EXPECT_NE(parse_color_stops("0:-12345,1:ffffff", stops), "");
    EXPECT_TRUE(stops.empty());

    ASSERT_EQ(parse_color_stops("0:#0A1b2C,1:ffffff", stops), "");
    ASSERT_EQ(stops.size(), 2u);
    EXPECT_EQ(stops[0].r, 0x0A);
    EXPECT_EQ(stops[0].g, 0x1B);
    EXPECT_EQ(stops[0].b, 0x2C);
}

TEST(Palette, CustomRejectsBadStops)
{
    EXPECT_THROW(Palette::custom({}), std::invalid_argument);
    EXPECT_THROW(Palette::custom({{0.0f, 0, 0, 0}}), std::invalid_argument);
    EXPECT_THROW(Palette::custom({{0.6f, 0, 0, 0}, {0.2f, 1, 1, 1}}), std::invalid_argument);
    EXPECT_THROW(Palette::builtin(PaletteKind::Custom), std::invalid_argument);
}

TEST(Palette, ColorizeContinuousAcrossIntegerCount)
{
    const Palette p = Palette::builtin(PaletteKind::Classic);
    ColorMapping m;
    for (int n = 1; n < 300; n += 7) {
        IterationResult below;
        below.escaped            = true;
        below.count              = n;
        below.smoothing_fraction = 0.999;
        IterationResult above;
        above.escaped            = true;
        above.count              = n + 1;
        above.smoothing_fraction = 0.0;
        EXPECT_LE(channel_distance(colorize(below, p, m, 512), colorize(above, p, m, 512)), 2)
            << "n=" << n;
    }
}
