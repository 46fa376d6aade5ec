#pragma once

#include "renderer.hpp"
#include "thread_pool.hpp"

#include <memory>

class CpuRenderer : public IFractalRenderer {
public:
    // n_threads <= 0 uses the hardware concurrency.
    explicit CpuRenderer(int n_threads = 0);

    // Throws std::invalid_argument when validate(req) fails.
    bool render(const RenderRequest& req, RasterBuffer& buf,
                const CancelToken* cancel = nullptr) override;

    // Fresh buffer per pass.
    RasterBuffer render(const RenderRequest& req);

    // Renders at 1/step resolution and upsamples nearest-neighbour into buf,
    // which ends up at the full viewport size. step <= 1 is a normal render.
    bool render_preview(const RenderRequest& req, int step, RasterBuffer& buf,
                        const CancelToken* cancel = nullptr);

    const RenderStats& last_stats() const { return stats; }
    double last_render_ms() const { return stats.milliseconds; }

    bool avx2_active() const { return use_avx2; }
    int  thread_count() const { return pool->size(); }
    int  hw_concurrency() const { return hw_threads; }

    // n <= 0 restores hw_concurrency
    void set_thread_count(int n);

    // Request the AVX2 path; ignored when the CPU or the build lacks it.
    void set_avx2(bool b) { use_avx2 = b && avx2_supported; }

private:
    void render_tile(const RenderRequest& req, RasterBuffer& buf,
                     int tx, int ty, int tw, int th) const;

    std::unique_ptr<ThreadPool> pool;
    RenderStats stats;
    int  hw_threads     = 1;
    bool avx2_supported = false;
    bool use_avx2       = false;
};

// Nearest-neighbour upsampling of src into dst (dst keeps its size).
void upsample_nearest(const RasterBuffer& src, int step, RasterBuffer& dst);
