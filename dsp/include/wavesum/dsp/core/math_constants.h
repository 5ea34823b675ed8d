// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants and frequency unit conversion.
// Phase arguments (omega * t) grow large, so the constants are double.
// ==============================================================================

#pragma once

#include <numbers>

namespace Wavesum {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi
inline constexpr double kPiD = std::numbers::pi;

/// Two times Pi (full circle in radians)
inline constexpr double kTwoPiD = 2.0 * kPiD;

// =============================================================================
// Frequency Unit Conversion
// =============================================================================

/// @brief Convert angular frequency (rad/s) to ordinary frequency (Hz)
/// @formula f = omega / (2 * pi)
[[nodiscard]] constexpr double angularToHz(double angularFrequency) noexcept {
    return angularFrequency / kTwoPiD;
}

/// @brief Convert ordinary frequency (Hz) to angular frequency (rad/s)
/// @formula omega = 2 * pi * f
[[nodiscard]] constexpr double hzToAngular(double frequencyHz) noexcept {
    return frequencyHz * kTwoPiD;
}

} // namespace DSP
} // namespace Wavesum
