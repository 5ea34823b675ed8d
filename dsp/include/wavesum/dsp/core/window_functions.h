// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis windows applied before the dominant-frequency FFT.
//
// Rectangular leaves the samples untouched (plain DFT of the waveform).
// Hann trades main-lobe width for much lower leakage between two components
// whose levels differ by tens of dB.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Wavesum {
namespace DSP {

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported analysis window types
enum class WindowType : uint8_t {
    Rectangular,  ///< No windowing (coherent gain 1)
    Hann          ///< Hann window, periodic variant (coherent gain 0.5)
};

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N)
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const double N = static_cast<double>(size);
    for (size_t n = 0; n < size; ++n) {
        const double phase = kTwoPiD * static_cast<double>(n) / N;
        output[n] = static_cast<float>(0.5 - 0.5 * std::cos(phase));
    }
}

/// @brief Fill buffer with the given window type
inline void generate(WindowType type, float* output, size_t size) noexcept {
    if (output == nullptr) return;

    switch (type) {
        case WindowType::Hann:
            generateHann(output, size);
            break;
        case WindowType::Rectangular:
        default:
            for (size_t n = 0; n < size; ++n) output[n] = 1.0f;
            break;
    }
}

/// @brief Mean window value (amplitude scaling of a bin-centred sinusoid)
/// @note A sinusoid of amplitude A lands in its bin with magnitude
///       A * N * coherentGain / 2
[[nodiscard]] constexpr float coherentGain(WindowType type) noexcept {
    return type == WindowType::Hann ? 0.5f : 1.0f;
}

} // namespace Window

} // namespace DSP
} // namespace Wavesum
