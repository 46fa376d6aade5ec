#include "zoom_sequence.hpp"
#include "export.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

RenderRequest zoom_sequence_frame(const RenderRequest& start,
                                  const ZoomSequenceOptions& opts, int index)
{
    RenderRequest req = start;
    req.viewport = zoom_at(start.viewport, opts.target,
                           std::pow(opts.zoom_factor, static_cast<double>(index)));
    if (opts.auto_iter)
        req.max_iter = detail_iterations(start.max_iter, zoom_level(req.viewport));
    return req;
}

// ---------------------------------------------------------------------------
// Frame file names
// ---------------------------------------------------------------------------

// A frame pattern split around its single "%d" / "%0Nd" conversion, with
// "%%" already turned into '%'.
struct FramePattern {
    std::string prefix;
    std::string suffix;
    bool        has_number = false;
    bool        zero_pad   = false;
    int         width      = 0;
};

static std::string parse_frame_pattern(const std::string& pattern, FramePattern& out)
{
    out = FramePattern();
    std::string* text = &out.prefix;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%') {
            *text += pattern[i];
            continue;
        }
        size_t j = i + 1;
        if (j < pattern.size() && pattern[j] == '%') {
            *text += '%';
            i = j;
            continue;
        }
        bool zero = false;
        if (j < pattern.size() && pattern[j] == '0') {
            zero = true;
            ++j;
        }
        int width = 0;
        while (j < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[j]))) {
            width = width * 10 + (pattern[j] - '0');
            if (width > 32)
                return "frame pattern '" + pattern + "': field width too large";
            ++j;
        }
        if (j >= pattern.size() || pattern[j] != 'd')
            return "frame pattern '" + pattern + "': only %d, %0Nd and %% are allowed";
        if (out.has_number)
            return "frame pattern '" + pattern + "': more than one frame number";
        out.has_number = true;
        out.zero_pad   = zero;
        out.width      = width;
        text = &out.suffix;
        i = j;
    }
    return {};
}

std::string check_frame_pattern(const std::string& pattern)
{
    FramePattern fp;
    return parse_frame_pattern(pattern, fp);
}

std::string frame_path(const std::string& pattern, int index)
{
    FramePattern fp;
    const bool valid = parse_frame_pattern(pattern, fp).empty();

    char num[48];
    if (valid && fp.has_number) {
        std::snprintf(num, sizeof(num), fp.zero_pad ? "%0*d" : "%*d", fp.width, index);
        return fp.prefix + num + fp.suffix;
    }

    // No conversion (or a malformed one, kept as literal text).
    const std::string base = valid ? fp.prefix : pattern;
    std::snprintf(num, sizeof(num), "_%04d", index);
    const size_t slash = base.find_last_of("/\\");
    const size_t dot   = base.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return base + num;
    return base.substr(0, dot) + num + base.substr(dot);
}

std::string render_zoom_sequence(CpuRenderer& renderer, const RenderRequest& start,
                                 const ZoomSequenceOptions& opts,
                                 const std::string& pattern,
                                 const CancelToken* cancel,
                                 const FrameCallback& on_frame)
{
    if (opts.frames <= 0)
        return "zoom sequence needs at least one frame";
    if (!std::isfinite(opts.zoom_factor) || opts.zoom_factor <= 0.0)
        return "zoom factor must be a positive finite number";
    const std::string pattern_err = check_frame_pattern(pattern);
    if (!pattern_err.empty())
        return pattern_err;

    RasterBuffer buf;
    for (int i = 0; i < opts.frames; ++i) {
        const RenderRequest req = zoom_sequence_frame(start, opts, i);
        const ConfigError err = validate(req);
        if (err != ConfigError::None)
            return std::string("frame ") + std::to_string(i) + ": " + config_error_message(err);

        if (!renderer.render(req, buf, cancel))
            return "zoom sequence cancelled at frame " + std::to_string(i);

        const std::string path = frame_path(pattern, i);
        const std::string msg  = export_image(path, buf, describe_request(req));
        if (!msg.empty())
            return msg;
        if (on_frame)
            on_frame(i, path, renderer.last_stats());
    }
    return {};
}
