#pragma once

#include "escape_time.hpp"

// AVX2 escape-time kernel, implemented in cpu_renderer_avx.cpp (compiled with
// -mavx2, only when SLEEF was found). Computes 4 consecutive horizontal pixels.
// x0:    real coordinate of pixel column 0
// px:    column of the leftmost of the 4 pixels (lane k is x0 + (px+k)*scale)
// scale: complex units per pixel
// im:    imaginary coordinate (same for all 4 pixels in a row)
// out4:  receives 4 results, same convention as evaluate()
void avx2_evaluate_4(double x0, int px, double scale, double im,
                     int max_iter, double bound, IterationResult* out4);

// True when this build contains the AVX2 kernel.
inline bool avx2_compiled()
{
#ifdef HAVE_SLEEF
    return true;
#else
    return false;
#endif
}
