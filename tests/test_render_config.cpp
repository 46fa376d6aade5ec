#include "render_config.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <string>
#include <vector>

// getopt wants mutable argv.
static std::string parse(std::vector<std::string> args, RenderConfig& cfg)
{
    args.insert(args.begin(), "mandelzoom");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(args.size()), argv.data(), cfg);
}

TEST(RenderConfig, Defaults)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({}, cfg), "");
    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_DOUBLE_EQ(req.viewport.center_re, -0.5);
    EXPECT_DOUBLE_EQ(req.viewport.center_im, 0.0);
    EXPECT_EQ(req.viewport.width, 800);
    EXPECT_EQ(req.viewport.height, 600);
    EXPECT_DOUBLE_EQ(req.viewport.scale, 3.0 / 800);
    EXPECT_EQ(req.max_iter, 256);
    EXPECT_EQ(req.palette.kind(), PaletteKind::Classic);
    EXPECT_EQ(cfg.output, "mandelbrot.png");
}

TEST(RenderConfig, ParsesShortAndLongOptions)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"-x", "-0.75", "--center-im=0.1", "-s", "0.005",
                     "-W", "320", "--height", "240", "-i", "1000",
                     "-p", "fire", "--color-scale", "log", "--cycle", "32",
                     "--offset", "0.25", "-t", "3", "--no-avx", "-o", "out.png", "-q"},
                    cfg), "");
    EXPECT_DOUBLE_EQ(cfg.center_re, -0.75);
    EXPECT_DOUBLE_EQ(cfg.center_im, 0.1);
    EXPECT_DOUBLE_EQ(cfg.scale, 0.005);
    EXPECT_EQ(cfg.width, 320);
    EXPECT_EQ(cfg.height, 240);
    EXPECT_EQ(cfg.max_iter, 1000);
    EXPECT_EQ(cfg.palette, "fire");
    EXPECT_EQ(cfg.mapping.scale, ColorScale::Logarithmic);
    EXPECT_DOUBLE_EQ(cfg.mapping.cycle_length, 32.0);
    EXPECT_DOUBLE_EQ(cfg.mapping.offset, 0.25);
    EXPECT_EQ(cfg.threads, 3);
    EXPECT_TRUE(cfg.no_avx);
    EXPECT_EQ(cfg.output, "out.png");
    EXPECT_TRUE(cfg.quiet);

    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_DOUBLE_EQ(req.viewport.scale, 0.005);
    EXPECT_EQ(req.palette.kind(), PaletteKind::Fire);
}

TEST(RenderConfig, ZoomSetsScaleUnlessScaleGiven)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"-z", "100", "-W", "600"}, cfg), "");
    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_NEAR(zoom_level(req.viewport), 100.0, 1e-9);

    RenderConfig both;
    ASSERT_EQ(parse({"-z", "100", "-s", "0.01"}, both), "");
    ASSERT_EQ(build_request(both, req), "");
    EXPECT_DOUBLE_EQ(req.viewport.scale, 0.01);
}

TEST(RenderConfig, AutoIterGrowsBudget)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"-z", "1000", "-i", "100", "--auto-iter"}, cfg), "");
    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_EQ(req.max_iter, detail_iterations(100, 1000.0));
    EXPECT_GT(req.max_iter, 100);
}

TEST(RenderConfig, AutoIterSaturatesLargeBudget)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"--auto-iter", "-i", "200000000", "-z", "1e10"}, cfg), "");
    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_GT(req.max_iter, 0);
    EXPECT_EQ(req.max_iter, INT_MAX);
    EXPECT_EQ(validate(req), ConfigError::None);
}

TEST(RenderConfig, CustomStopsOverridePalette)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"-p", "ice", "--stops", "0:000000,1:ff0000"}, cfg), "");
    RenderRequest req;
    ASSERT_EQ(build_request(cfg, req), "");
    EXPECT_EQ(req.palette.kind(), PaletteKind::Custom);
    EXPECT_EQ(req.palette.sample(1.0), pack_rgb(255, 0, 0));
}

TEST(RenderConfig, SequenceOptions)
{
    RenderConfig cfg;
    ASSERT_EQ(parse({"--frames", "12", "--zoom-factor", "1.5", "--benchmark"}, cfg), "");
    EXPECT_EQ(cfg.frames, 12);
    EXPECT_DOUBLE_EQ(cfg.zoom_factor, 1.5);
    EXPECT_TRUE(cfg.benchmark);
}

TEST(RenderConfig, SequenceOutputPattern)
{
    auto sequence = [](const char* output) {
        RenderConfig cfg;
        return parse({"--frames", "3", "-o", output}, cfg);
    };
    EXPECT_EQ(sequence("zoom_%04d.png"), "");
    EXPECT_EQ(sequence("100%%_%d.png"), "");
    EXPECT_NE(sequence("a_%s.png"), "");
    EXPECT_NE(sequence("100%.png"), "");
    EXPECT_NE(sequence("%d_%d.png"), "");

    // A single image is written to the path as given.
    RenderConfig single;
    EXPECT_EQ(parse({"-o", "100%.png"}, single), "");
}

TEST(RenderConfig, UsageErrors)
{
    RenderConfig cfg;
    EXPECT_NE(parse({"--bogus"}, cfg), "");
    EXPECT_NE(parse({"-W", "wide"}, cfg), "");
    EXPECT_NE(parse({"-x", "1.0abc"}, cfg), "");
    EXPECT_NE(parse({"-i"}, cfg), "");
    EXPECT_NE(parse({"--color-scale", "sqrt"}, cfg), "");
    EXPECT_NE(parse({"--frames", "0"}, cfg), "");
    EXPECT_NE(parse({"--zoom-factor", "-2"}, cfg), "");
    EXPECT_NE(parse({"stray"}, cfg), "");
}

TEST(RenderConfig, ConfigurationErrors)
{
    RenderRequest req;

    RenderConfig cfg;
    cfg.width = 0;
    EXPECT_EQ(build_request(cfg, req), config_error_message(ConfigError::InvalidViewport));

    cfg = RenderConfig();
    cfg.max_iter = 0;
    EXPECT_EQ(build_request(cfg, req), config_error_message(ConfigError::IterationBudgetTooLow));

    cfg = RenderConfig();
    cfg.bound = -1.0;
    EXPECT_EQ(build_request(cfg, req), config_error_message(ConfigError::InvalidBound));

    cfg = RenderConfig();
    cfg.scale = 0.0;
    cfg.zoom  = 0.0;
    EXPECT_EQ(build_request(cfg, req), config_error_message(ConfigError::InvalidViewport));

    cfg = RenderConfig();
    cfg.palette = "plasma";
    EXPECT_NE(build_request(cfg, req), "");

    cfg = RenderConfig();
    cfg.stops = "0:000000";
    EXPECT_NE(build_request(cfg, req), "");
}
