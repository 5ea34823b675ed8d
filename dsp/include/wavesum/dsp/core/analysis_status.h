// ==============================================================================
// Layer 0: Core Utility - Analysis Status Codes
// ==============================================================================
// Status codes shared by the superposition and analysis paths. The library
// reports failures by value (no exceptions); every status has a stable
// identifier and a human-readable message that names the offending input.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Wavesum {
namespace DSP {

/// @brief Outcome of a superposition or analysis call
enum class AnalysisStatus : uint8_t {
    Ok = 0,                ///< Success
    EmptyTimeDomain,       ///< Time domain has no samples
    NonFiniteTime,         ///< Time domain contains NaN or infinity
    LengthMismatch,        ///< Paired buffers differ in length
    TooFewSamples,         ///< Spectral analysis needs at least 2 samples
    MissingSampleRate,     ///< sampleRate is zero, negative or non-finite
    NonUniformTimeDomain,  ///< Time domain is not strictly increasing with uniform spacing
    NonFiniteSample,       ///< Waveform contains NaN or infinity
    TransformUnavailable   ///< FFT backend could not be set up for the requested size
};

/// @brief Stable identifier for a status (e.g. for logs and test output)
[[nodiscard]] constexpr const char* statusName(AnalysisStatus status) noexcept {
    switch (status) {
        case AnalysisStatus::Ok:                   return "Ok";
        case AnalysisStatus::EmptyTimeDomain:      return "EmptyTimeDomain";
        case AnalysisStatus::NonFiniteTime:        return "NonFiniteTime";
        case AnalysisStatus::LengthMismatch:       return "LengthMismatch";
        case AnalysisStatus::TooFewSamples:        return "TooFewSamples";
        case AnalysisStatus::MissingSampleRate:    return "MissingSampleRate";
        case AnalysisStatus::NonUniformTimeDomain: return "NonUniformTimeDomain";
        case AnalysisStatus::NonFiniteSample:      return "NonFiniteSample";
        case AnalysisStatus::TransformUnavailable: return "TransformUnavailable";
    }
    return "Unknown";
}

/// @brief Human-readable description of a status
[[nodiscard]] constexpr const char* statusMessage(AnalysisStatus status) noexcept {
    switch (status) {
        case AnalysisStatus::Ok:
            return "ok";
        case AnalysisStatus::EmptyTimeDomain:
            return "time domain is empty; at least one sample time is required";
        case AnalysisStatus::NonFiniteTime:
            return "time domain contains a non-finite sample time";
        case AnalysisStatus::LengthMismatch:
            return "waveform and time domain (or output buffer) lengths differ";
        case AnalysisStatus::TooFewSamples:
            return "spectral analysis needs a waveform of at least 2 samples";
        case AnalysisStatus::MissingSampleRate:
            return "sampleRate is missing: pass a positive finite sampleRate or the "
                   "time domain the waveform was sampled over";
        case AnalysisStatus::NonUniformTimeDomain:
            return "time domain must be strictly increasing with uniform spacing";
        case AnalysisStatus::NonFiniteSample:
            return "waveform contains a non-finite sample";
        case AnalysisStatus::TransformUnavailable:
            return "no FFT available for this waveform length (setup failed or too long)";
    }
    return "unknown status";
}

} // namespace DSP
} // namespace Wavesum
