#include "cpu_renderer.hpp"
#include "cpu_renderer_avx.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

static constexpr int TILE_W = 64;
static constexpr int TILE_H = 64;

// -----------------------------------------------------------------------
// Constructor: detect AVX2, build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer(int n_threads)
{
#if defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
    avx2_supported = avx2_compiled() && __builtin_cpu_supports("avx2");
#endif
    use_avx2 = avx2_supported;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_threads = n;
    pool = std::make_unique<ThreadPool>(n_threads > 0 ? n_threads : n);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_threads;
    if (n == pool->size()) return;
    pool = std::make_unique<ThreadPool>(n);
}

// -----------------------------------------------------------------------
// Tile renderer: called from thread pool workers. Writes only the pixels
// of its own tile.
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const RenderRequest& req, RasterBuffer& buf,
                              int tx, int ty, int tw, int th) const
{
    const Viewport& vp    = req.viewport;
    const int       W     = buf.width;
    const int       H     = buf.height;
    const double    scale = vp.scale;
    const double    x0    = vp.center_re - W * 0.5 * scale;
    const double    y0    = vp.center_im - H * 0.5 * scale;

    for (int py = ty; py < ty + th && py < H; ++py) {
        const double im  = y0 + py * scale;
        uint32_t*    row = buf.row(py);
        int          px  = tx;
        const int    end = std::min(tx + tw, W);

#ifdef HAVE_SLEEF
        // --- AVX2 path: 4 pixels per iteration ---
        if (use_avx2) {
            IterationResult res4[4];
            for (; px + 4 <= end; px += 4) {
                avx2_evaluate_4(x0, px, scale, im, req.max_iter, req.bound, res4);
                for (int k = 0; k < 4; ++k)
                    row[px + k] = colorize(res4[k], req.palette, req.mapping, req.max_iter);
            }
        }
#endif

        // --- Scalar path: remainder pixels (or full row without AVX2) ---
        for (; px < end; ++px) {
            const IterationResult r = evaluate(x0 + px * scale, im, req.max_iter, req.bound);
            row[px] = colorize(r, req.palette, req.mapping, req.max_iter);
        }
    }
}

// -----------------------------------------------------------------------
// Top-level render: splits image into tiles and dispatches to thread pool
// -----------------------------------------------------------------------
bool CpuRenderer::render(const RenderRequest& req, RasterBuffer& buf,
                         const CancelToken* cancel)
{
    const ConfigError err = validate(req);
    if (err != ConfigError::None)
        throw std::invalid_argument(config_error_message(err));

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const int W = req.viewport.width, H = req.viewport.height;
    if (buf.width != W || buf.height != H)
        buf.resize(W, H);

    std::atomic<int> rendered{0};
    int total = 0;
    for (int ty = 0; ty < H; ty += TILE_H) {
        for (int tx = 0; tx < W; tx += TILE_W) {
            const int tw = std::min(TILE_W, W - tx);
            const int th = std::min(TILE_H, H - ty);
            ++total;
            pool->submit([this, &req, &buf, &rendered, cancel, tx, ty, tw, th] {
                if (cancel && cancel->cancelled()) return;
                render_tile(req, buf, tx, ty, tw, th);
                rendered.fetch_add(1, std::memory_order_relaxed);
            });
        }
    }
    pool->wait();

    stats.tiles_total    = total;
    stats.tiles_rendered = rendered.load();
    stats.cancelled      = stats.tiles_rendered < total;
    stats.milliseconds   = std::chrono::duration<double, std::milli>(
                               clock::now() - t0).count();
    return !stats.cancelled;
}

RasterBuffer CpuRenderer::render(const RenderRequest& req)
{
    RasterBuffer buf;
    render(req, buf);
    return buf;
}

bool CpuRenderer::render_preview(const RenderRequest& req, int step, RasterBuffer& buf,
                                 const CancelToken* cancel)
{
    if (step <= 1)
        return render(req, buf, cancel);

    const Viewport& vp = req.viewport;
    RenderRequest small = req;
    small.viewport.width  = std::max(1, (vp.width  + step - 1) / step);
    small.viewport.height = std::max(1, (vp.height + step - 1) / step);
    small.viewport.scale  = vp.scale * step;

    RasterBuffer low;
    const bool done = render(small, low, cancel);

    const double ms = stats.milliseconds;
    buf.resize(vp.width, vp.height);
    upsample_nearest(low, step, buf);
    stats.milliseconds = ms;
    return done;
}

void upsample_nearest(const RasterBuffer& src, int step, RasterBuffer& dst)
{
    if (src.width <= 0 || src.height <= 0 || step < 1) return;
    for (int y = 0; y < dst.height; ++y) {
        const int sy  = std::min(y / step, src.height - 1);
        uint32_t* row = dst.row(y);
        for (int x = 0; x < dst.width; ++x)
            row[x] = src.at(std::min(x / step, src.width - 1), sy);
    }
}
