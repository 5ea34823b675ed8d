// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral and Level Math
// ==============================================================================
// Bin magnitudes and level reductions using Google Highway for runtime SIMD
// dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "wavesum/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Wavesum {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputeMagnitudeImpl: Complex[] -> mags[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputeMagnitudeImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                          float* HWY_RESTRICT mags) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        // Load interleaved [real0, imag0, real1, imag1, ...] into separate vectors
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        // Magnitude: sqrt(re^2 + im^2)
        const auto mag = hn::Sqrt(hn::MulAdd(im, im, hn::Mul(re, re)));
        hn::StoreU(mag, d, mags + k);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
    }
}

// -----------------------------------------------------------------------------
// PeakAbsoluteImpl: max |x|
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
float PeakAbsoluteImpl(const float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    auto peak = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        peak = hn::Max(peak, hn::Abs(hn::LoadU(d, data + k)));
    }

    float result = hn::GetLane(hn::MaxOfLanes(d, peak));

    // Scalar tail
    for (; k < count; ++k) {
        result = std::max(result, std::abs(data[k]));
    }
    return result;
}

// -----------------------------------------------------------------------------
// SumOfSquaresImpl: sum x^2
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
float SumOfSquaresImpl(const float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    auto acc = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::LoadU(d, data + k);
        acc = hn::MulAdd(v, v, acc);
    }

    float result = hn::ReduceSum(d, acc);

    // Scalar tail
    for (; k < count; ++k) {
        result += data[k] * data[k];
    }
    return result;
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Wavesum

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "wavesum/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Wavesum {
namespace DSP {

HWY_EXPORT(ComputeMagnitudeImpl);
HWY_EXPORT(PeakAbsoluteImpl);
HWY_EXPORT(SumOfSquaresImpl);

void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept {
    if (complexData == nullptr || mags == nullptr || numBins == 0) return;
    HWY_DYNAMIC_DISPATCH(ComputeMagnitudeImpl)(complexData, numBins, mags);
}

float peakAbsolute(const float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 0.0f;
    return HWY_DYNAMIC_DISPATCH(PeakAbsoluteImpl)(data, count);
}

float sumOfSquares(const float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 0.0f;
    return HWY_DYNAMIC_DISPATCH(SumOfSquaresImpl)(data, count);
}

}  // namespace DSP
}  // namespace Wavesum

#endif  // HWY_ONCE
