#pragma once

#include "cpu_renderer.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

// Metadata of a finished frame handed out by BackgroundRenderer::poll().
struct FrameInfo {
    Viewport    viewport;
    int         max_iter     = 0;
    int         preview_step = 1;
    uint64_t    serial       = 0;   // submit() order, starting at 1
    RenderStats stats;
};

// Runs render passes on one worker thread so the caller (a UI loop) never
// blocks. Only the newest request matters: submit() drops a queued request and
// cancels the one in flight at the next tile boundary.
class BackgroundRenderer {
public:
    explicit BackgroundRenderer(int n_threads = 0);
    ~BackgroundRenderer();

    BackgroundRenderer(const BackgroundRenderer&)            = delete;
    BackgroundRenderer& operator=(const BackgroundRenderer&) = delete;

    // Returns the serial assigned to this request.
    uint64_t submit(const RenderRequest& req, int preview_step = 1);

    // Moves the newest finished frame into `out`. Returns false when nothing
    // new finished since the last poll.
    bool poll(RasterBuffer& out, FrameInfo* info = nullptr);

    // Blocks until no request is queued or running.
    void wait_idle();

    bool busy() const;

    // Applied before the next pass starts.
    void set_thread_count(int n);
    void set_avx2(bool b);

    int  thread_count() const;
    int  hw_concurrency() const { return hw_threads; }
    bool avx2_active() const;

private:
    struct Job {
        RenderRequest req;
        int           preview_step = 1;
        uint64_t      serial       = 0;
    };

    void worker_loop();

    CpuRenderer               cpu;
    CancelToken               cancel;
    mutable std::mutex        mtx;
    std::condition_variable   cv_job;
    std::condition_variable   cv_idle;
    std::unique_ptr<Job>      pending;
    bool                      running  = false;
    bool                      stopping = false;
    uint64_t                  next_serial = 0;

    RasterBuffer              ready_buf;
    FrameInfo                 ready_info;
    bool                      has_ready = false;

    int                       want_threads = 0;
    bool                      want_avx2    = true;
    int                       cur_threads  = 0;
    bool                      cur_avx2     = false;
    int                       hw_threads   = 1;

    std::thread               worker;  // last: starts after every member above exists
};
