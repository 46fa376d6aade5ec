#include "cpu_renderer.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <map>
#include <stdexcept>

static RenderRequest overview_request(int w = 800, int h = 600)
{
    RenderRequest req;
    req.viewport.center_re = -0.5;
    req.viewport.center_im = 0.0;
    req.viewport.scale     = 0.005;
    req.viewport.width     = w;
    req.viewport.height    = h;
    req.max_iter           = 256;
    return req;
}

TEST(CpuRenderer, OverviewRendersOpaqueImageWithBlackInterior)
{
    CpuRenderer renderer(4);
    RasterBuffer buf;
    ASSERT_TRUE(renderer.render(overview_request(), buf));

    ASSERT_EQ(buf.width, 800);
    ASSERT_EQ(buf.height, 600);
    ASSERT_EQ(buf.pixels.size(), 800u * 600u);
    for (uint32_t px : buf.pixels)
        ASSERT_EQ(alpha_of(px), 0xFF);

    // (-0.5, 0) lies in the main cardioid.
    EXPECT_EQ(buf.at(400, 300), INTERIOR_COLOR);
    // Top-left corner (-2.5, -1.5) escapes immediately.
    EXPECT_NE(buf.at(0, 0), INTERIOR_COLOR);

    std::map<uint32_t, int> histogram;
    for (int y = 200; y < 400; ++y)
        for (int x = 300; x < 500; ++x)
            ++histogram[buf.at(x, y)];
    uint32_t most = 0;
    int      best = 0;
    for (const auto& kv : histogram) {
        if (kv.second > best) { best = kv.second; most = kv.first; }
    }
    EXPECT_EQ(most, INTERIOR_COLOR);

    const RenderStats& st = renderer.last_stats();
    EXPECT_EQ(st.tiles_total, 13 * 10);
    EXPECT_EQ(st.tiles_rendered, st.tiles_total);
    EXPECT_FALSE(st.cancelled);
    EXPECT_GE(st.milliseconds, 0.0);
}

TEST(CpuRenderer, MatchesPerPixelEvaluation)
{
    CpuRenderer renderer(3);
    renderer.set_avx2(false);
    RenderRequest req = overview_request(97, 61);
    req.palette = Palette::builtin(PaletteKind::Fire);
    req.mapping.scale = ColorScale::Linear;

    const RasterBuffer buf = renderer.render(req);
    const Viewport&    vp  = req.viewport;
    const double x0 = vp.center_re - vp.width  * 0.5 * vp.scale;
    const double y0 = vp.center_im - vp.height * 0.5 * vp.scale;
    for (int y = 0; y < vp.height; ++y) {
        for (int x = 0; x < vp.width; ++x) {
            const IterationResult r = evaluate(x0 + x * vp.scale, y0 + y * vp.scale,
                                               req.max_iter, req.bound);
            ASSERT_EQ(buf.at(x, y), colorize(r, req.palette, req.mapping, req.max_iter))
                << x << "," << y;
        }
    }
}

TEST(CpuRenderer, ThreadCountDoesNotChangeImage)
{
    CpuRenderer renderer(1);
    renderer.set_avx2(false);
    const RenderRequest req = overview_request(300, 200);
    const RasterBuffer one = renderer.render(req);
    renderer.set_thread_count(5);
    EXPECT_EQ(renderer.thread_count(), 5);
    const RasterBuffer five = renderer.render(req);
    EXPECT_EQ(one.pixels, five.pixels);
}

TEST(CpuRenderer, SinglePixelImage)
{
    CpuRenderer renderer(2);
    RenderRequest req = overview_request(1, 1);
    req.viewport.center_re = 0.0;
    req.viewport.scale     = 1e-3;
    const RasterBuffer buf = renderer.render(req);
    ASSERT_EQ(buf.pixels.size(), 1u);
    EXPECT_EQ(buf.at(0, 0), INTERIOR_COLOR);
}

TEST(CpuRenderer, RejectsInvalidRequests)
{
    CpuRenderer renderer(1);
    RasterBuffer buf;

    RenderRequest req = overview_request();
    req.viewport.width = 0;
    EXPECT_THROW(renderer.render(req, buf), std::invalid_argument);

    req = overview_request();
    req.viewport.scale = -1.0;
    EXPECT_THROW(renderer.render(req, buf), std::invalid_argument);

    req = overview_request();
    req.max_iter = 0;
    EXPECT_EQ(validate(req), ConfigError::IterationBudgetTooLow);
    EXPECT_THROW(renderer.render(req, buf), std::invalid_argument);

    req = overview_request();
    req.bound = 0.0;
    EXPECT_EQ(validate(req), ConfigError::InvalidBound);

    req = overview_request();
    req.mapping.offset = 1.0;
    EXPECT_EQ(validate(req), ConfigError::InvalidColorMapping);
    req.mapping.offset       = 0.0;
    req.mapping.cycle_length = 0.0;
    EXPECT_EQ(validate(req), ConfigError::InvalidColorMapping);
}

TEST(CpuRenderer, CancelledBeforeStartRendersNoTiles)
{
    CpuRenderer renderer(2);
    CancelToken cancel;
    cancel.cancel();
    RasterBuffer buf;
    EXPECT_FALSE(renderer.render(overview_request(), buf, &cancel));
    EXPECT_TRUE(renderer.last_stats().cancelled);
    EXPECT_EQ(renderer.last_stats().tiles_rendered, 0);
    EXPECT_EQ(buf.width, 800);
    EXPECT_EQ(buf.height, 600);
}

TEST(CpuRenderer, PreviewHasFullSize)
{
    CpuRenderer renderer(2);
    RasterBuffer buf;
    const RenderRequest req = overview_request(203, 101);
    ASSERT_TRUE(renderer.render_preview(req, 3, buf));
    EXPECT_EQ(buf.width, 203);
    EXPECT_EQ(buf.height, 101);
    // Every 3x3 block is one color.
    EXPECT_EQ(buf.at(0, 0), buf.at(2, 2));
    EXPECT_EQ(buf.at(199, 99), buf.at(200, 100));
}

TEST(CpuRenderer, UpsampleNearestReplicatesBlocks)
{
    RasterBuffer src;
    src.resize(2, 1);
    src.pixels[0] = pack_rgb(1, 2, 3);
    src.pixels[1] = pack_rgb(4, 5, 6);

    RasterBuffer dst;
    dst.resize(5, 2);
    upsample_nearest(src, 2, dst);
    EXPECT_EQ(dst.at(0, 0), src.pixels[0]);
    EXPECT_EQ(dst.at(1, 1), src.pixels[0]);
    EXPECT_EQ(dst.at(2, 0), src.pixels[1]);
    EXPECT_EQ(dst.at(4, 1), src.pixels[1]);
}

TEST(CpuRenderer, Avx2AgreesWithScalar)
{
    CpuRenderer renderer(2);
    if (!renderer.avx2_active())
        GTEST_SKIP() << "AVX2 kernel not available";

    RenderRequest req = overview_request(320, 240);
    req.viewport = zoom_at(req.viewport, PlanePoint{-0.743643887, 0.131825904}, 50.0);
    req.max_iter = 1024;

    const RasterBuffer vec = renderer.render(req);
    renderer.set_avx2(false);
    const RasterBuffer ref = renderer.render(req);

    int differ = 0;
    for (size_t i = 0; i < ref.pixels.size(); ++i) {
        const uint32_t a = vec.pixels[i], b = ref.pixels[i];
        ASSERT_EQ(a == INTERIOR_COLOR, b == INTERIOR_COLOR) << "pixel " << i;
        if (std::abs(red_of(a) - red_of(b))     > 1 ||
            std::abs(green_of(a) - green_of(b)) > 1 ||
            std::abs(blue_of(a) - blue_of(b))   > 1)
            ++differ;
    }
    EXPECT_LE(differ, static_cast<int>(ref.pixels.size() / 1000));
}
