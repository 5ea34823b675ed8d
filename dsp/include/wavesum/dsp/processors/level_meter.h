// ==============================================================================
// Layer 2: DSP Processor - Level Meter
// ==============================================================================
// Peak and RMS amplitude of a waveform, backed by the SIMD reductions in
// spectral_simd.h.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/spectral_simd.h>

#include <cmath>
#include <cstddef>
#include <span>

namespace Wavesum {
namespace DSP {
namespace LevelMeter {

/// @brief Peak amplitude: max |x|
/// @return 0 for an empty buffer
[[nodiscard]] inline float peak(std::span<const float> samples) noexcept {
    return peakAbsolute(samples.data(), samples.size());
}

/// @brief Root-mean-square amplitude: sqrt(sum(x^2) / N)
/// @return 0 for an empty buffer
/// @note A sinusoid of amplitude A over whole periods has RMS A / sqrt(2)
[[nodiscard]] inline float rms(std::span<const float> samples) noexcept {
    if (samples.empty()) return 0.0f;
    const float energy = sumOfSquares(samples.data(), samples.size());
    return std::sqrt(energy / static_cast<float>(samples.size()));
}

/// @brief True when every sample is finite
[[nodiscard]] inline bool allFinite(std::span<const float> samples) noexcept {
    for (float x : samples) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

} // namespace LevelMeter
} // namespace DSP
} // namespace Wavesum
