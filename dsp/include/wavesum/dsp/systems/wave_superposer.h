// ==============================================================================
// Layer 3: System Component - Wave Superposer
// ==============================================================================
// Superimposes two simple-harmonic-motion signals and summarizes the result:
//
//     x(t) = A1 * sin(w1 * t + phi1) + A2 * sin(w2 * t + phi2)
//     Ai   = reference * 10^(dBi / 20)
//
// computeSuperposition() samples x over a caller-supplied time domain.
// getDbAndDominantFrequency() reports the waveform amplitude in dB (inverse
// of the same reference conversion) and its dominant frequency.
//
// Frequency units: inputs are angular (rad/s). The dominant frequency is
// reported as ordinary frequency in Hz; dominantAngularFrequency() gives
// 2pi * Hz in the input units.
//
// The superposer is immutable after construction; every query is const and
// safe to call concurrently.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/analysis_status.h>
#include <wavesum/dsp/core/db_utils.h>
#include <wavesum/dsp/core/math_constants.h>
#include <wavesum/dsp/core/time_domain.h>
#include <wavesum/dsp/core/window_functions.h>
#include <wavesum/dsp/primitives/harmonic_component.h>
#include <wavesum/dsp/processors/dominant_frequency_analyzer.h>
#include <wavesum/dsp/processors/level_meter.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Wavesum {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief How the waveform amplitude is measured before conversion to dB
enum class AmplitudeMeasure : uint8_t {
    Peak,        ///< max |x|
    Rms,         ///< sqrt(mean(x^2))
    DominantBin  ///< Sinusoid amplitude estimated from the dominant FFT bin
};

/// @brief Superposer parameters with documented defaults
struct SuperposerConfig {
    float level1Db = 0.0f;                 ///< First component level (dB re reference)
    float level2Db = 0.0f;                 ///< Second component level (dB re reference)
    double angularFrequency1 = 0.0;        ///< First component omega (rad/s)
    double angularFrequency2 = 0.0;        ///< Second component omega (rad/s)
    double phase1 = 0.0;                   ///< First component phase (rad)
    double phase2 = 0.0;                   ///< Second component phase (rad)
    float referenceAmplitude = kDefaultReferenceAmplitude;  ///< Linear amplitude of 0 dB
    AmplitudeMeasure amplitudeMeasure = AmplitudeMeasure::Peak;
    WindowType window = WindowType::Rectangular;  ///< Window for dominant-frequency FFT
};

// =============================================================================
// Results
// =============================================================================

/// @brief Sampled superposed waveform
struct SuperpositionResult {
    AnalysisStatus status = AnalysisStatus::Ok;
    std::vector<float> samples;  ///< One value per time sample (empty on failure)

    [[nodiscard]] std::string message() const { return statusMessage(status); }

    explicit operator bool() const noexcept { return status == AnalysisStatus::Ok; }
};

/// @brief Amplitude in dB and dominant frequency of a waveform
struct AnalysisResult {
    AnalysisStatus status = AnalysisStatus::Ok;
    float amplitudeDb = kSilenceFloorDb;  ///< Measured amplitude, dB re reference
    double dominantFrequencyHz = 0.0;     ///< Ordinary frequency (Hz)
    double binWidthHz = 0.0;              ///< Frequency resolution of the analysis
    double sampleRate = 0.0;              ///< Sample rate used (given or inferred)

    /// @brief Dominant frequency in the input's angular units (2pi * Hz)
    [[nodiscard]] double dominantAngularFrequency() const noexcept {
        return hzToAngular(dominantFrequencyHz);
    }

    [[nodiscard]] std::string message() const { return statusMessage(status); }

    explicit operator bool() const noexcept { return status == AnalysisStatus::Ok; }
};

// =============================================================================
// WaveSuperposer
// =============================================================================

/// @brief Sum of two SHM signals with amplitude/dominant-frequency summary
class WaveSuperposer {
public:
    /// @brief Construct from the six scalar parameters
    /// @param db1 First component level in dB
    /// @param db2 Second component level in dB
    /// @param w1 First component angular frequency (rad/s)
    /// @param w2 Second component angular frequency (rad/s)
    /// @param phi1 First component phase (rad)
    /// @param phi2 Second component phase (rad)
    WaveSuperposer(float db1, float db2, double w1, double w2,
                   double phi1 = 0.0, double phi2 = 0.0) noexcept
        : WaveSuperposer(SuperposerConfig{db1, db2, w1, w2, phi1, phi2}) {}

    explicit WaveSuperposer(const SuperposerConfig& config) noexcept
        : first_(config.level1Db, config.angularFrequency1, config.phase1)
        , second_(config.level2Db, config.angularFrequency2, config.phase2)
        , referenceAmplitude_(config.referenceAmplitude)
        , amplitudeMeasure_(config.amplitudeMeasure)
        , window_(config.window) {}

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const HarmonicComponent& first() const noexcept { return first_; }
    [[nodiscard]] const HarmonicComponent& second() const noexcept { return second_; }
    [[nodiscard]] float referenceAmplitude() const noexcept { return referenceAmplitude_; }
    [[nodiscard]] AmplitudeMeasure amplitudeMeasure() const noexcept { return amplitudeMeasure_; }
    [[nodiscard]] WindowType window() const noexcept { return window_; }

    // -------------------------------------------------------------------------
    // Superposition
    // -------------------------------------------------------------------------

    /// @brief Sample the superposed wave into a caller-supplied buffer
    /// @param timeDomain Sample times (non-empty, finite)
    /// @param output Destination, same length as timeDomain
    /// @return Ok, EmptyTimeDomain, NonFiniteTime or LengthMismatch;
    ///         output is untouched on failure
    [[nodiscard]] AnalysisStatus computeSuperposition(std::span<const double> timeDomain,
                                                      std::span<float> output) const noexcept {
        const AnalysisStatus status = validateTimeDomain(timeDomain);
        if (status != AnalysisStatus::Ok) {
            return status;
        }
        if (output.size() != timeDomain.size()) {
            return AnalysisStatus::LengthMismatch;
        }

        const double amp1 = static_cast<double>(first_.amplitude(referenceAmplitude_));
        const double amp2 = static_cast<double>(second_.amplitude(referenceAmplitude_));

        for (size_t i = 0; i < timeDomain.size(); ++i) {
            const double t = timeDomain[i];
            output[i] = static_cast<float>(first_.evaluate(t, amp1) + second_.evaluate(t, amp2));
        }
        return AnalysisStatus::Ok;
    }

    /// @brief Sample the superposed wave over a time domain
    /// @return Waveform with one value per time sample, or an error status
    ///         (EmptyTimeDomain, NonFiniteTime) with no samples
    /// @note NOT real-time safe (allocates)
    [[nodiscard]] SuperpositionResult computeSuperposition(
        std::span<const double> timeDomain) const {
        SuperpositionResult result;
        result.status = validateTimeDomain(timeDomain);
        if (result.status != AnalysisStatus::Ok) {
            return result;
        }

        result.samples.resize(timeDomain.size());
        result.status = computeSuperposition(timeDomain, std::span<float>(result.samples));
        if (result.status != AnalysisStatus::Ok) {
            result.samples.clear();
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Analysis
    // -------------------------------------------------------------------------

    /// @brief Amplitude (dB) and dominant frequency of a waveform
    /// @param waveform Samples (at least 2, all finite)
    /// @param sampleRate Sample rate in Hz; required, there is no default
    /// @note NOT real-time safe (allocates the FFT for each call)
    [[nodiscard]] AnalysisResult getDbAndDominantFrequency(std::span<const float> waveform,
                                                           double sampleRate) const {
        AnalysisResult result;
        result.sampleRate = sampleRate;

        DominantFrequencyAnalyzer analyzer;
        analyzer.setWindow(window_);
        if (waveform.size() >= 2) {
            analyzer.prepare(waveform.size());
        }

        const SpectralPeak peak = analyzer.analyze(waveform, sampleRate);
        if (!peak) {
            result.status = peak.status;
            return result;
        }

        result.dominantFrequencyHz = peak.frequencyHz;
        result.binWidthHz = peak.binWidthHz;
        result.amplitudeDb = gainToDb(measureAmplitude(waveform, peak), referenceAmplitude_);
        return result;
    }

    /// @brief Amplitude (dB) and dominant frequency, sample rate taken from
    ///        the time domain the waveform was sampled over
    /// @param waveform Samples (at least 2, all finite)
    /// @param timeDomain Uniformly spaced, strictly increasing times, same length
    /// @return Error statuses additionally include LengthMismatch,
    ///         NonFiniteTime and NonUniformTimeDomain
    [[nodiscard]] AnalysisResult getDbAndDominantFrequency(
        std::span<const float> waveform, std::span<const double> timeDomain) const {
        AnalysisResult result;

        if (waveform.size() != timeDomain.size()) {
            result.status = AnalysisStatus::LengthMismatch;
            return result;
        }
        if (waveform.size() < 2) {
            result.status = AnalysisStatus::TooFewSamples;
            return result;
        }

        double sampleRate = 0.0;
        result.status = inferSampleRate(timeDomain, sampleRate);
        if (result.status != AnalysisStatus::Ok) {
            return result;
        }

        return getDbAndDominantFrequency(waveform, sampleRate);
    }

private:
    [[nodiscard]] float measureAmplitude(std::span<const float> waveform,
                                         const SpectralPeak& peak) const noexcept {
        switch (amplitudeMeasure_) {
            case AmplitudeMeasure::Rms:
                return LevelMeter::rms(waveform);
            case AmplitudeMeasure::DominantBin:
                return peak.amplitude;
            case AmplitudeMeasure::Peak:
            default:
                return LevelMeter::peak(waveform);
        }
    }

    HarmonicComponent first_;
    HarmonicComponent second_;
    float referenceAmplitude_ = kDefaultReferenceAmplitude;
    AmplitudeMeasure amplitudeMeasure_ = AmplitudeMeasure::Peak;
    WindowType window_ = WindowType::Rectangular;
};

} // namespace DSP
} // namespace Wavesum
