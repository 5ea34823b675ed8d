// ==============================================================================
// Layer 0: Core Utility - Time Domain Helpers
// ==============================================================================
// Sample-time grids supplied by the caller to the superposer, validation of
// those grids, and sample-rate inference from uniformly spaced times.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/analysis_status.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <vector>

namespace Wavesum {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Maximum relative deviation of any spacing from the mean spacing for a
/// time domain to count as uniform
inline constexpr double kUniformSpacingTolerance = 1e-6;

// =============================================================================
// Grid Generation
// =============================================================================

/// @brief Evenly spaced sample times over [start, stop], both endpoints included
/// @param start First sample time
/// @param stop Last sample time
/// @param count Number of samples
/// @return count times; count == 1 yields {start}, count == 0 yields {}
/// @note NOT real-time safe (allocates)
///
/// @example makeLinearTimeDomain(0.0, 10.0, 1000) -> spacing 10/999 s
[[nodiscard]] inline std::vector<double> makeLinearTimeDomain(double start,
                                                              double stop,
                                                              size_t count) {
    std::vector<double> times(count);
    if (count == 0) return times;
    if (count == 1) {
        times[0] = start;
        return times;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        times[i] = start + step * static_cast<double>(i);
    }
    // Pin the last sample so it is exactly stop (no accumulated rounding)
    times[count - 1] = stop;
    return times;
}

// =============================================================================
// Validation
// =============================================================================

/// @brief Check that a time domain is non-empty and entirely finite
/// @return Ok, EmptyTimeDomain or NonFiniteTime
[[nodiscard]] inline AnalysisStatus validateTimeDomain(
    std::span<const double> times) noexcept {
    if (times.empty()) {
        return AnalysisStatus::EmptyTimeDomain;
    }
    for (double t : times) {
        if (!std::isfinite(t)) {
            return AnalysisStatus::NonFiniteTime;
        }
    }
    return AnalysisStatus::Ok;
}

/// @brief Infer the sample rate of a uniformly spaced time domain
///
/// The rate is the reciprocal of the mean spacing (t[n-1] - t[0]) / (n - 1).
/// Every individual spacing must match the mean within
/// kUniformSpacingTolerance (relative), or within 4 epsilon of the largest
/// |t| when that is wider (grids offset by large timestamps).
///
/// @param times Sample times (at least 2)
/// @param[out] sampleRate Inferred rate in Hz; untouched on failure
/// @return Ok, EmptyTimeDomain, NonFiniteTime, TooFewSamples or NonUniformTimeDomain
[[nodiscard]] inline AnalysisStatus inferSampleRate(std::span<const double> times,
                                                    double& sampleRate) noexcept {
    const AnalysisStatus status = validateTimeDomain(times);
    if (status != AnalysisStatus::Ok) {
        return status;
    }
    if (times.size() < 2) {
        return AnalysisStatus::TooFewSamples;
    }

    const double meanSpacing =
        (times.back() - times.front()) / static_cast<double>(times.size() - 1);
    if (!(meanSpacing > 0.0) || !std::isfinite(meanSpacing)) {
        return AnalysisStatus::NonUniformTimeDomain;
    }

    // Differences of large timestamps carry rounding of a few ulps of |t|
    const double magnitude = std::max(std::abs(times.front()), std::abs(times.back()));
    const double tolerance =
        std::max(meanSpacing * kUniformSpacingTolerance,
                 4.0 * std::numeric_limits<double>::epsilon() * magnitude);
    for (size_t i = 1; i < times.size(); ++i) {
        const double spacing = times[i] - times[i - 1];
        if (std::abs(spacing - meanSpacing) > tolerance) {
            return AnalysisStatus::NonUniformTimeDomain;
        }
    }

    sampleRate = 1.0 / meanSpacing;
    return AnalysisStatus::Ok;
}

} // namespace DSP
} // namespace Wavesum
