#pragma once

#include <algorithm>
#include <cmath>

constexpr double DEFAULT_BOUND = 2.0;

struct IterationResult {
    bool   escaped            = false;
    int    count              = 0;    // escape iteration, or max_iter for interior points
    double smoothing_fraction = 0.0;  // [0, 1), 0 for interior points
};

// Largest double below 1.0; upper clamp for the smoothing fraction.
constexpr double FRACTION_MAX = 1.0 - 1.0 / 9007199254740992.0;  // 1 - 2^-53

// Fractional part of the normalized iteration count
//     mu = n + 1 - log2(log|z_n| / log(bound))
// given |z_n|^2 at escape. For bound 2 this is the usual n + 1 - log2(log2|z_n|),
// continuous across the escape boundary. Compared with the textbook
// n + 1 - log(log|z_n|) / log 2 it is shifted by the constant log2(ln bound)
// (about -0.53 for bound 2), so the fraction runs from just below 1 at
// |z_n| = bound down to 0 at |z_n| = bound^2. Values that would be NaN or fall
// outside [0, 1) are clamped.
inline double smoothing_fraction(double mag2, double log_bound)
{
    const double log_zn = std::log(mag2) * 0.5;
    if (!(log_zn > 0.0) || !(log_bound > 0.0))
        return 0.0;
    const double frac = 1.0 - std::log2(log_zn / log_bound);
    if (!(frac > 0.0))
        return 0.0;
    return std::min(frac, FRACTION_MAX);
}

// Escape-time iteration z <- z^2 + c, z0 = 0.
//
// Convention: iterate z_n is tested *before* stepping, for n = 0..max_iter-1;
// the first n with |z_n| >= bound is the escape count. z0 = 0 never escapes, so
// escaped points report count >= 1 (c = 2 escapes at count 1).
// Called once per pixel: no allocation, no branches besides the loop test.
inline IterationResult evaluate(double c_re, double c_im, int max_iter,
                                double bound = DEFAULT_BOUND)
{
    const double bound2 = bound * bound;
    double zr = 0.0;
    double zi = 0.0;
    for (int i = 0; i < max_iter; ++i) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 >= bound2) {
            IterationResult r;
            r.escaped            = true;
            r.count              = i;
            r.smoothing_fraction = smoothing_fraction(zr2 + zi2, std::log(bound));
            return r;
        }
        const double new_zr = zr2 - zi2 + c_re;
        zi = 2.0*zr*zi + c_im;
        zr = new_zr;
    }
    IterationResult r;
    r.escaped = false;
    r.count   = std::max(max_iter, 0);
    return r;
}

// Continuous escape value count + fraction (max_iter for interior points).
inline double smooth_value(const IterationResult& r)
{
    return static_cast<double>(r.count) + r.smoothing_fraction;
}
