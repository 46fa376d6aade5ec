// Compiled with -mavx2 only: do NOT include from other translation units.

#include "cpu_renderer_avx.hpp"

#include <immintrin.h>
#include <sleef.h>
#include <algorithm>
#include <cmath>

// -----------------------------------------------------------------------
// 4-lane escape-time kernel.
//
// Mirrors evaluate(): z_i is tested before the step, lanes escape at the
// first i with |z_i|^2 >= bound^2, and z updates use mul+add/sub in the
// same order as the scalar loop (no FMA), so counts agree with the scalar
// path bit for bit. Only the smoothing logarithms come from SLEEF.
// -----------------------------------------------------------------------
void avx2_evaluate_4(double x0, int px, double scale, double im,
                     int max_iter, double bound, IterationResult* out4)
{
    const __m256d cr = _mm256_set_pd(x0 + (px + 3) * scale, x0 + (px + 2) * scale,
                                     x0 + (px + 1) * scale, x0 +  px      * scale);
    const __m256d ci = _mm256_set1_pd(im);
    __m256d zr = _mm256_setzero_pd();
    __m256d zi = _mm256_setzero_pd();

    const __m256d bound2 = _mm256_set1_pd(bound * bound);
    const __m256d one    = _mm256_set1_pd(1.0);

    // active: all bits set for lanes that have not yet escaped
    __m256d active   = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    // iters_d counts completed steps for still-active lanes; at escape
    // test i it equals i.
    __m256d iters_d  = _mm256_setzero_pd();
    __m256d final_r2 = bound2;

    for (int i = 0; i < max_iter; ++i) {
        const __m256d zr2  = _mm256_mul_pd(zr, zr);
        const __m256d zi2  = _mm256_mul_pd(zi, zi);
        const __m256d mag2 = _mm256_add_pd(zr2, zi2);

        // Lanes escaping this iteration (mag2 >= bound^2 AND still active)
        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, bound2, _CMP_GE_OQ), active);

        // Record |z|^2 at escape for smooth coloring
        final_r2 = _mm256_blendv_pd(final_r2, mag2, just_esc);
        active   = _mm256_andnot_pd(just_esc, active);

        if (_mm256_movemask_pd(active) == 0) break;

        // zr^2 - zi^2 + cr,  2*zr*zi + ci
        const __m256d new_zr = _mm256_add_pd(_mm256_sub_pd(zr2, zi2), cr);
        const __m256d new_zi = _mm256_add_pd(_mm256_mul_pd(_mm256_add_pd(zr, zr), zi), ci);

        // Freeze escaped lanes
        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);

        iters_d = _mm256_add_pd(iters_d, _mm256_and_pd(active, one));
    }

    // frac = 1 - log2(log|z| / log(bound)), clamped per lane below
    const __m256d inv_log2  = _mm256_set1_pd(1.0 / std::log(2.0));
    const __m256d half      = _mm256_set1_pd(0.5);
    const double  log_bound = std::log(bound);
    const __m256d log_zn    = _mm256_mul_pd(Sleef_logd4_u35(final_r2), half);
    const __m256d ratio     = _mm256_div_pd(log_zn, _mm256_set1_pd(log_bound));
    const __m256d frac      = _mm256_sub_pd(one, _mm256_mul_pd(Sleef_logd4_u35(ratio), inv_log2));

    double counts[4], fracs[4], logs[4];
    _mm256_storeu_pd(counts, iters_d);
    _mm256_storeu_pd(fracs, frac);
    _mm256_storeu_pd(logs, log_zn);
    const int still_active = _mm256_movemask_pd(active);

    for (int k = 0; k < 4; ++k) {
        IterationResult& r = out4[k];
        if (still_active & (1 << k)) {
            r.escaped            = false;
            r.count              = std::max(max_iter, 0);
            r.smoothing_fraction = 0.0;
            continue;
        }
        r.escaped = true;
        r.count   = static_cast<int>(counts[k]);
        const double f = fracs[k];
        if (!(logs[k] > 0.0) || !(log_bound > 0.0) || !(f > 0.0))
            r.smoothing_fraction = 0.0;
        else
            r.smoothing_fraction = std::min(f, FRACTION_MAX);
    }
}
