#pragma once

#include "viewport.hpp"
#include "escape_time.hpp"
#include "palette.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR, row-major.
struct RasterBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), INTERIOR_COLOR);
    }

    uint32_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    uint32_t* row(int y)            { return pixels.data() + static_cast<size_t>(y) * width; }
};

// Everything one render pass reads. Passed by value; never mutated while a
// pass is running.
struct RenderRequest {
    Viewport     viewport;
    int          max_iter = 256;
    double       bound    = DEFAULT_BOUND;
    Palette      palette;
    ColorMapping mapping;
};

inline ConfigError validate(const RenderRequest& req)
{
    const ConfigError vp_err = validate(req.viewport);
    if (vp_err != ConfigError::None)
        return vp_err;
    if (req.max_iter <= 0)
        return ConfigError::IterationBudgetTooLow;
    if (!std::isfinite(req.bound) || req.bound <= 0.0)
        return ConfigError::InvalidBound;
    if (!std::isfinite(req.mapping.cycle_length) || req.mapping.cycle_length <= 0.0 ||
        !(req.mapping.offset >= 0.0 && req.mapping.offset < 1.0))
        return ConfigError::InvalidColorMapping;
    return ConfigError::None;
}

struct RenderStats {
    double milliseconds   = 0.0;
    int    tiles_total    = 0;
    int    tiles_rendered = 0;
    bool   cancelled      = false;
};

// Coarse-grained cancellation, checked by the renderer before each tile.
class CancelToken {
public:
    void cancel()          { flag.store(true, std::memory_order_relaxed); }
    void reset()           { flag.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return flag.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag{false};
};

class IFractalRenderer {
public:
    virtual ~IFractalRenderer() = default;

    // Renders into buf, resizing it to the viewport's dimensions. Returns false
    // when the pass was abandoned through `cancel`; the buffer then holds a
    // partial image.
    virtual bool render(const RenderRequest& req, RasterBuffer& buf,
                        const CancelToken* cancel = nullptr) = 0;
};
