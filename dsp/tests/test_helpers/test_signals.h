#pragma once
// ==============================================================================
// Test Signal Generators
// ==============================================================================
// Reference signals and time grids for verifying the superposition and
// analysis paths. Evaluated in double precision and stored as float, the same
// way the library samples its waveforms.
// ==============================================================================

#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

namespace TestHelpers {

constexpr double kTwoPi = 2.0 * std::numbers::pi;

// ==============================================================================
// Sine Wave
// ==============================================================================
// Pure sinusoid at an ordinary frequency. Used for dominant-frequency tests.

inline std::vector<float> generateSine(size_t size,
                                       double frequencyHz,
                                       double sampleRate,
                                       double amplitude = 1.0,
                                       double phase = 0.0) {
    std::vector<float> buffer(size);
    for (size_t i = 0; i < size; ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        buffer[i] = static_cast<float>(amplitude * std::sin(kTwoPi * frequencyHz * t + phase));
    }
    return buffer;
}

// ==============================================================================
// SHM Term
// ==============================================================================
// A * sin(omega * t + phi) over an explicit time grid.

inline std::vector<float> generateShmTerm(const std::vector<double>& times,
                                          double amplitude,
                                          double angularFrequency,
                                          double phase = 0.0) {
    std::vector<float> buffer(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        buffer[i] = static_cast<float>(amplitude * std::sin(angularFrequency * times[i] + phase));
    }
    return buffer;
}

// ==============================================================================
// Time Grid
// ==============================================================================
// t[i] = start + i / sampleRate. Used where a test needs an exact rate.

inline std::vector<double> generateTimeGrid(size_t size, double sampleRate, double start = 0.0) {
    std::vector<double> times(size);
    for (size_t i = 0; i < size; ++i) {
        times[i] = start + static_cast<double>(i) / sampleRate;
    }
    return times;
}

// ==============================================================================
// DC Signal
// ==============================================================================

inline std::vector<float> generateDC(size_t size, float level = 1.0f) {
    return std::vector<float>(size, level);
}

} // namespace TestHelpers
