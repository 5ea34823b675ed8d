// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral and Level Math
// ==============================================================================
// Bulk bin magnitudes and waveform level reductions using Google Highway for
// runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These are the vectorized equivalents of per-bin sqrt(re^2 + im^2) and of the
// max |x| / sum x^2 loops used for peak and RMS measurement.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Wavesum {
namespace DSP {

/// @brief Bulk compute magnitudes from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @note SIMD-accelerated with runtime ISA dispatch
void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept;

/// @brief Largest absolute sample value
/// @param data Input samples
/// @param count Number of samples
/// @return max |data[i]|, or 0 for an empty buffer
/// @note SIMD-accelerated with runtime ISA dispatch
[[nodiscard]] float peakAbsolute(const float* data, size_t count) noexcept;

/// @brief Sum of squared samples (energy)
/// @param data Input samples
/// @param count Number of samples
/// @return sum data[i]^2, or 0 for an empty buffer
/// @note SIMD-accelerated with runtime ISA dispatch
[[nodiscard]] float sumOfSquares(const float* data, size_t count) noexcept;

} // namespace DSP
} // namespace Wavesum
