// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Amplitude Conversion Functions
// ==============================================================================
// Decibel levels are amplitude ratios against a reference level:
//
//     amplitude = reference * 10^(dB / 20)
//     dB        = 20 * log10(amplitude / reference)
//
// The default reference is 1.0 (full-scale unit amplitude, dBFS-style), so
// 0 dB is unity amplitude, 60 dB is 1000 and 80 dB is 10000.
//
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <cmath>
#include <limits>

namespace Wavesum {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence in decibels.
/// Represents approximately 24-bit dynamic range (6.02 dB/bit * 24 = ~144 dB).
/// Returned by gainToDb() when the amplitude is zero, negative, or NaN, and
/// treated by dbToGain() as a mute: any level at or below it is exactly 0.
inline constexpr float kSilenceFloorDb = -144.0f;

/// Default reference amplitude (the linear amplitude of 0 dB)
inline constexpr float kDefaultReferenceAmplitude = 1.0f;

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear amplitude.
///
/// @param dB         Decibel level
/// @param reference  Linear amplitude of 0 dB (default 1.0)
/// @return           Linear amplitude (>= 0 for a non-negative reference)
///
/// @formula   amplitude = reference * 10^(dB/20)
///
/// @note      NaN input returns 0.0
/// @note      dB <= kSilenceFloorDb returns exactly 0.0 (mute)
///
/// @example   dbToGain(0.0f)    -> 1.0f
/// @example   dbToGain(-20.0f)  -> 0.1f
/// @example   dbToGain(60.0f)   -> 1000.0f
/// @example   dbToGain(6.0206f, 0.5f) -> ~1.0f
///
[[nodiscard]] inline float dbToGain(float dB,
                                    float reference = kDefaultReferenceAmplitude) noexcept {
    if (std::isnan(dB) || dB <= kSilenceFloorDb) {
        return 0.0f;
    }
    return reference * std::pow(10.0f, dB / 20.0f);
}

/// Convert linear amplitude to decibels.
///
/// @param gain       Linear amplitude
/// @param reference  Linear amplitude of 0 dB (default 1.0)
/// @return           Decibel value (clamped to kSilenceFloorDb minimum)
///
/// @formula   dB = 20 * log10(gain / reference), clamped to floor
///
/// @note      Zero/negative/NaN input, or a non-positive reference, returns
///            kSilenceFloorDb
/// @note      Positive infinity returns positive infinity
///
/// @example   gainToDb(1.0f)     -> 0.0f
/// @example   gainToDb(10000.0f) -> 80.0f
/// @example   gainToDb(0.0f)     -> -144.0f
///
[[nodiscard]] inline float gainToDb(float gain,
                                    float reference = kDefaultReferenceAmplitude) noexcept {
    if (std::isnan(gain) || gain <= 0.0f || !(reference > 0.0f)) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain / reference);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Wavesum
