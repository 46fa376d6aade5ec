#include "cpu_renderer.hpp"
#include "render_config.hpp"
#include "export.hpp"
#include "zoom_sequence.hpp"
#include "cli_benchmark.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// mandelzoom: render one image (or a zoom sequence) from the command line.
// Exit status: 0 ok, 1 configuration/encoding error, 2 usage error.
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    RenderConfig cfg;
    const std::string parse_err = parse_args(argc, argv, cfg);
    if (!parse_err.empty()) {
        fprintf(stderr, "%s: %s\n\n", argv[0], parse_err.c_str());
        print_usage(stderr, argv[0]);
        return 2;
    }
    if (cfg.help) {
        print_usage(stdout, argv[0]);
        return 0;
    }
    if (cfg.benchmark)
        return run_cli_benchmark(cfg.threads);

    RenderRequest req;
    const std::string cfg_err = build_request(cfg, req);
    if (!cfg_err.empty()) {
        fprintf(stderr, "%s: %s\n", argv[0], cfg_err.c_str());
        return 1;
    }

    CpuRenderer renderer(cfg.threads);
    if (cfg.no_avx)
        renderer.set_avx2(false);

    if (!cfg.quiet)
        printf("center (%.12g, %.12g)  zoom %.6gx  %dx%d  iter %d  palette %s  [%s  %dt]\n",
               req.viewport.center_re, req.viewport.center_im, zoom_level(req.viewport),
               req.viewport.width, req.viewport.height, req.max_iter, req.palette.name(),
               renderer.avx2_active() ? "AVX2" : "scalar", renderer.thread_count());

    if (cfg.frames > 0) {
        ZoomSequenceOptions opts;
        opts.target      = {req.viewport.center_re, req.viewport.center_im};
        opts.frames      = cfg.frames;
        opts.zoom_factor = cfg.zoom_factor;
        opts.auto_iter   = cfg.auto_iter;
        if (cfg.auto_iter) {
            // build_request already grew the budget for frame 0; restart from the base.
            req.max_iter = cfg.max_iter;
        }
        const bool quiet = cfg.quiet;
        const std::string msg = render_zoom_sequence(
            renderer, req, opts, cfg.output, nullptr,
            [quiet](int index, const std::string& path, const RenderStats& stats) {
                if (!quiet)
                    printf("frame %4d  %8.1f ms  %s\n", index, stats.milliseconds, path.c_str());
            });
        if (!msg.empty()) {
            fprintf(stderr, "%s: %s\n", argv[0], msg.c_str());
            return 1;
        }
        return 0;
    }

    RasterBuffer buf;
    try {
        renderer.render(req, buf);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "%s: %s\n", argv[0], e.what());
        return 1;
    }
    if (!cfg.quiet)
        printf("rendered in %.1f ms (%d tiles)\n",
               renderer.last_render_ms(), renderer.last_stats().tiles_total);

    const std::string msg = export_image(cfg.output, buf, describe_request(req));
    if (!msg.empty()) {
        fprintf(stderr, "%s: %s\n", argv[0], msg.c_str());
        return 1;
    }
    if (!cfg.quiet)
        printf("saved %s\n", cfg.output.c_str());
    return 0;
}
