#pragma once

#include "cpu_renderer.hpp"

#include <functional>
#include <string>

struct ZoomSequenceOptions {
    PlanePoint target;               // every frame is centered here
    int        frames      = 60;
    double     zoom_factor = 1.1;    // scale is divided by this per frame
    bool       auto_iter   = false;  // grow max_iter with zoom (detail_iterations)
};

// Viewport and iteration budget of frame `index`.
RenderRequest zoom_sequence_frame(const RenderRequest& start,
                                  const ZoomSequenceOptions& opts, int index);

// Checks an output pattern: at most one "%d" or "%0Nd" frame number, "%%" for a
// literal percent sign, no other '%' directives. Returns an empty string or
// the reason the pattern is rejected.
std::string check_frame_pattern(const std::string& pattern);

// Output path of frame `index`. The number replaces the pattern's "%d" / "%0Nd"
// (e.g. "zoom_%03d.png"); without one, "_NNNN" goes before the extension.
// A pattern rejected by check_frame_pattern is taken literally.
std::string frame_path(const std::string& pattern, int index);

using FrameCallback = std::function<void(int index, const std::string& path,
                                         const RenderStats& stats)>;

// Renders and encodes every frame in order. Returns an empty string on
// success, or the first error (encoding failure, cancellation).
std::string render_zoom_sequence(CpuRenderer& renderer, const RenderRequest& start,
                                 const ZoomSequenceOptions& opts,
                                 const std::string& pattern,
                                 const CancelToken* cancel = nullptr,
                                 const FrameCallback& on_frame = FrameCallback());
