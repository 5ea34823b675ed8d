// ==============================================================================
// Layer 1: DSP Primitive - Harmonic Component
// ==============================================================================
// One simple-harmonic-motion term:
//
//     x(t) = amplitude(levelDb) * sin(omega * t + phase)
//
// where amplitude(levelDb) = reference * 10^(levelDb / 20) (see db_utils.h).
// The phase argument is evaluated in double precision: omega * t reaches
// thousands of radians over a few seconds of a 200 rad/s component.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/db_utils.h>
#include <wavesum/dsp/core/math_constants.h>

#include <cmath>

namespace Wavesum {
namespace DSP {

/// @brief Immutable descriptor of a sinusoidal (SHM) signal
///
/// Angular frequency may be negative; the result is a sign-flipped sinusoid
/// rather than an error. Levels at or below kSilenceFloorDb are muted.
class HarmonicComponent {
public:
    HarmonicComponent() noexcept = default;

    /// @param levelDb Level in decibels relative to the reference amplitude
    /// @param angularFrequency Angular frequency in rad/s
    /// @param phase Phase offset in radians
    constexpr HarmonicComponent(float levelDb, double angularFrequency,
                                double phase = 0.0) noexcept
        : levelDb_(levelDb)
        , angularFrequency_(angularFrequency)
        , phase_(phase) {}

    [[nodiscard]] constexpr float levelDb() const noexcept { return levelDb_; }
    [[nodiscard]] constexpr double angularFrequency() const noexcept { return angularFrequency_; }
    [[nodiscard]] constexpr double phase() const noexcept { return phase_; }

    /// @brief Ordinary frequency in Hz (omega / 2pi)
    [[nodiscard]] constexpr double frequencyHz() const noexcept {
        return angularToHz(angularFrequency_);
    }

    /// @brief Linear amplitude for the given reference level
    [[nodiscard]] float amplitude(float reference = kDefaultReferenceAmplitude) const noexcept {
        return dbToGain(levelDb_, reference);
    }

    /// @brief Evaluate the term at time t with a precomputed amplitude
    [[nodiscard]] double evaluate(double t, double linearAmplitude) const noexcept {
        return linearAmplitude * std::sin(angularFrequency_ * t + phase_);
    }

    /// @brief Evaluate the term at time t
    [[nodiscard]] double valueAt(double t,
                                 float reference = kDefaultReferenceAmplitude) const noexcept {
        return evaluate(t, static_cast<double>(amplitude(reference)));
    }

private:
    float levelDb_ = 0.0f;
    double angularFrequency_ = 0.0;
    double phase_ = 0.0;
};

} // namespace DSP
} // namespace Wavesum
