#pragma once

#include "cpu_renderer.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

// Single-threaded and all-threads throughput of the scalar and AVX2 paths on
// the default framing, in megapixels per second.
inline int run_cli_benchmark(int threads)
{
    CpuRenderer renderer(1);

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;

    struct TestCase {
        const char* label;
        Viewport    viewport;
        int         max_iter;
    };

    Viewport overview = default_viewport(W, H);
    Viewport seahorse = zoom_at(overview, PlanePoint{-0.743643887, 0.131825904}, 200.0);

    const TestCase tests[] = {
        {"Overview  (256 iter)",          overview,  256},
        {"Overview  (1024 iter)",         overview, 1024},
        {"Seahorse valley x200 (1024)",   seahorse, 1024},
    };

    const int  all_threads = threads > 0 ? threads : renderer.hw_concurrency();
    const bool has_avx2    = renderer.avx2_active();

    printf("mandelzoom CLI benchmark\n");
    printf("%dx%d, %d runs (avg best %d)\n", W, H, RUNS, BEST_N);
    printf("AVX2 supported: %s\n\n", has_avx2 ? "yes" : "no");
    printf("%-32s %-8s %-8s %s\n", "Label", "Path", "Threads", "Mpix/s");
    printf("--------------------------------------------------------------\n");

    RasterBuffer buf;
    for (const auto& t : tests) {
        RenderRequest req;
        req.viewport = t.viewport;
        req.max_iter = t.max_iter;

        for (int path = 0; path < 2; ++path) {
            const bool avx2 = path == 0;
            if (avx2 && !has_avx2) continue;
            renderer.set_avx2(avx2);

            for (int tc : {1, all_threads}) {
                renderer.set_thread_count(tc);

                // Warm-up
                renderer.render(req, buf);

                std::vector<double> times(RUNS);
                for (int r = 0; r < RUNS; ++r) {
                    renderer.render(req, buf);
                    times[r] = renderer.last_render_ms();
                }
                std::sort(times.begin(), times.end());
                double avg_ms = 0.0;
                for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
                avg_ms /= BEST_N;
                const double mpixs = (W * H) / (avg_ms * 1000.0);

                printf("%-32s %-8s %-8d %6.2f\n", t.label, avx2 ? "AVX2" : "scalar", tc, mpixs);
                if (tc == all_threads) break;
            }
        }
    }

    renderer.set_avx2(has_avx2);  // restore
    return 0;
}
