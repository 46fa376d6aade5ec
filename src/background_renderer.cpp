#include "background_renderer.hpp"

#include <cstdio>
#include <exception>
#include <utility>

BackgroundRenderer::BackgroundRenderer(int n_threads)
    : cpu(n_threads)
{
    hw_threads   = cpu.hw_concurrency();
    want_threads = n_threads;
    cur_threads  = cpu.thread_count();
    cur_avx2     = cpu.avx2_active();
    want_avx2    = cur_avx2;
    worker       = std::thread([this] { worker_loop(); });
}

BackgroundRenderer::~BackgroundRenderer()
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
        pending.reset();
        cancel.cancel();
    }
    cv_job.notify_all();
    worker.join();
}

uint64_t BackgroundRenderer::submit(const RenderRequest& req, int preview_step)
{
    auto job = std::make_unique<Job>(Job{req, preview_step, 0});
    uint64_t serial;
    {
        std::lock_guard<std::mutex> lock(mtx);
        serial      = ++next_serial;
        job->serial = serial;
        pending     = std::move(job);
        if (running)
            cancel.cancel();
    }
    cv_job.notify_one();
    return serial;
}

bool BackgroundRenderer::poll(RasterBuffer& out, FrameInfo* info)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (!has_ready)
        return false;
    out = std::move(ready_buf);
    ready_buf = RasterBuffer{};
    if (info) *info = ready_info;
    has_ready = false;
    return true;
}

void BackgroundRenderer::wait_idle()
{
    std::unique_lock<std::mutex> lock(mtx);
    cv_idle.wait(lock, [this] { return !pending && !running; });
}

bool BackgroundRenderer::busy() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return pending || running;
}

void BackgroundRenderer::set_thread_count(int n)
{
    std::lock_guard<std::mutex> lock(mtx);
    want_threads = n;
}

void BackgroundRenderer::set_avx2(bool b)
{
    std::lock_guard<std::mutex> lock(mtx);
    want_avx2 = b;
}

int BackgroundRenderer::thread_count() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return cur_threads;
}

bool BackgroundRenderer::avx2_active() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return cur_avx2;
}

// -----------------------------------------------------------------------
// Worker: take the newest job, render it, publish it unless a newer job
// arrived meanwhile.
// -----------------------------------------------------------------------
void BackgroundRenderer::worker_loop()
{
    while (true) {
        std::unique_ptr<Job> job;
        int  threads;
        bool avx2;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv_job.wait(lock, [this] { return pending || stopping; });
            if (stopping) return;
            job     = std::move(pending);
            running = true;
            cancel.reset();
            threads = want_threads;
            avx2    = want_avx2;
        }

        cpu.set_thread_count(threads);
        cpu.set_avx2(avx2);

        RasterBuffer buf;
        bool done = false;
        try {
            done = cpu.render_preview(job->req, job->preview_step, buf, &cancel);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "background render #%llu failed: %s\n",
                         static_cast<unsigned long long>(job->serial), e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mtx);
            cur_threads = cpu.thread_count();
            cur_avx2    = cpu.avx2_active();
            if (done) {
                ready_buf               = std::move(buf);
                ready_info.viewport     = job->req.viewport;
                ready_info.max_iter     = job->req.max_iter;
                ready_info.preview_step = job->preview_step;
                ready_info.serial       = job->serial;
                ready_info.stats        = cpu.last_stats();
                has_ready               = true;
            }
            running = false;
        }
        cv_idle.notify_all();
    }
}
