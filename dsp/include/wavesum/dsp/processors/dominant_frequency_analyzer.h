// ==============================================================================
// Layer 2: DSP Processor - Dominant Frequency Analyzer
// ==============================================================================
// Finds the strongest non-DC component of a real waveform.
//
// Algorithm:
//   1. Apply the analysis window to the N input samples
//   2. Zero-pad to the prepared FFT size (next power of 2 >= N, min 32)
//   3. Forward FFT (SIMD-accelerated via pffft)
//   4. Bin magnitudes (SIMD-accelerated via Highway)
//   5. Pick the bin of maximum magnitude, skipping bin 0 (DC)
//
// Reported frequency is ordinary (cyclic) frequency: bin * sampleRate / fftSize.
// The angular equivalent is 2pi times that value.
// ==============================================================================

#pragma once

#include <wavesum/dsp/core/analysis_status.h>
#include <wavesum/dsp/core/math_constants.h>
#include <wavesum/dsp/core/spectral_simd.h>
#include <wavesum/dsp/core/window_functions.h>
#include <wavesum/dsp/primitives/fft.h>
#include <wavesum/dsp/processors/level_meter.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Wavesum {
namespace DSP {

// =============================================================================
// SpectralPeak
// =============================================================================

/// @brief Dominant spectral component of a waveform
struct SpectralPeak {
    AnalysisStatus status = AnalysisStatus::Ok;
    size_t bin = 0;             ///< Dominant bin index (0 only for a silent waveform)
    size_t fftSize = 0;         ///< Transform size used (after zero-padding)
    double frequencyHz = 0.0;   ///< Ordinary frequency of the dominant bin
    double binWidthHz = 0.0;    ///< sampleRate / fftSize
    float magnitude = 0.0f;     ///< Raw |X[bin]|
    float amplitude = 0.0f;     ///< Estimated sinusoid amplitude at the bin

    /// @brief Angular frequency of the dominant bin (2pi * frequencyHz)
    [[nodiscard]] double angularFrequency() const noexcept {
        return hzToAngular(frequencyHz);
    }

    explicit operator bool() const noexcept { return status == AnalysisStatus::Ok; }
};

// =============================================================================
// DominantFrequencyAnalyzer
// =============================================================================

/// @brief FFT peak picker for waveforms of up to a prepared maximum length
///
/// @par Usage
/// @code
/// DominantFrequencyAnalyzer analyzer;
/// analyzer.prepare(waveform.size());
/// SpectralPeak peak = analyzer.analyze(waveform, 1000.0);
/// if (peak) { use(peak.frequencyHz); }
/// @endcode
class DominantFrequencyAnalyzer {
public:
    DominantFrequencyAnalyzer() noexcept = default;

    DominantFrequencyAnalyzer(const DominantFrequencyAnalyzer&) = delete;
    DominantFrequencyAnalyzer& operator=(const DominantFrequencyAnalyzer&) = delete;
    DominantFrequencyAnalyzer(DominantFrequencyAnalyzer&&) noexcept = default;
    DominantFrequencyAnalyzer& operator=(DominantFrequencyAnalyzer&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Allocate the FFT and work buffers for waveforms up to maxSamples
    /// @note NOT real-time safe (allocates memory)
    void prepare(size_t maxSamples) {
        maxSamples_ = 0;
        const size_t fftSize = fftSizeFor(maxSamples);
        fft_.prepare(fftSize);
        if (!fft_.isPrepared()) {
            return;
        }

        padded_.assign(fftSize, 0.0f);
        spectrum_.assign(fft_.numBins(), Complex{});
        magnitudes_.assign(fft_.numBins(), 0.0f);
        window_.assign(maxSamples, 1.0f);
        windowSize_ = 0;
        maxSamples_ = maxSamples;
    }

    /// @brief Select the analysis window (default Rectangular)
    void setWindow(WindowType type) noexcept {
        if (type != windowType_) {
            windowType_ = type;
            windowSize_ = 0;
        }
    }

    [[nodiscard]] WindowType window() const noexcept { return windowType_; }

    [[nodiscard]] bool isPrepared() const noexcept {
        return fft_.isPrepared() && maxSamples_ > 0;
    }

    [[nodiscard]] size_t maxSamples() const noexcept { return maxSamples_; }

    [[nodiscard]] size_t fftSize() const noexcept { return fft_.size(); }

    // -------------------------------------------------------------------------
    // Analysis
    // -------------------------------------------------------------------------

    /// @brief Find the dominant non-DC frequency of a waveform
    /// @param samples Waveform (2 <= size <= maxSamples())
    /// @param sampleRate Sample rate in Hz (positive, finite)
    /// @return Peak description; status is TooFewSamples, MissingSampleRate,
    ///         NonFiniteSample or TransformUnavailable on failure
    /// @note Ties resolve to the lowest bin. A waveform with no energy outside
    ///       DC reports bin 0 and 0 Hz.
    [[nodiscard]] SpectralPeak analyze(std::span<const float> samples,
                                       double sampleRate) noexcept {
        SpectralPeak result;

        if (samples.size() < 2) {
            result.status = AnalysisStatus::TooFewSamples;
            return result;
        }
        if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
            result.status = AnalysisStatus::MissingSampleRate;
            return result;
        }
        if (!LevelMeter::allFinite(samples)) {
            result.status = AnalysisStatus::NonFiniteSample;
            return result;
        }
        if (!isPrepared() || samples.size() > maxSamples_) {
            result.status = AnalysisStatus::TransformUnavailable;
            return result;
        }

        const size_t n = samples.size();
        const size_t fftSize = fft_.size();
        const size_t numBins = fft_.numBins();

        updateWindow(n);

        for (size_t i = 0; i < n; ++i) {
            padded_[i] = samples[i] * window_[i];
        }
        std::fill(padded_.begin() + static_cast<std::ptrdiff_t>(n), padded_.end(), 0.0f);

        fft_.forward(padded_.data(), spectrum_.data());
        computeMagnitudeBulk(reinterpret_cast<const float*>(spectrum_.data()),
                             numBins, magnitudes_.data());

        // Skip DC (bin 0); strict > keeps the lowest bin on ties
        size_t peakBin = 0;
        float peakMag = 0.0f;
        for (size_t k = 1; k < numBins; ++k) {
            if (magnitudes_[k] > peakMag) {
                peakMag = magnitudes_[k];
                peakBin = k;
            }
        }

        result.fftSize = fftSize;
        result.binWidthHz = sampleRate / static_cast<double>(fftSize);
        result.bin = peakBin;
        result.frequencyHz = static_cast<double>(peakBin) * result.binWidthHz;
        result.magnitude = peakMag;

        // A bin-centred sinusoid of amplitude A has |X| = A * N * gain / 2
        // (A * N * gain at Nyquist, which has no mirror image)
        const float sideFactor = (peakBin == fftSize / 2) ? 1.0f : 2.0f;
        const float denom = static_cast<float>(n) * Window::coherentGain(windowType_);
        result.amplitude = sideFactor * peakMag / denom;

        return result;
    }

private:
    void updateWindow(size_t n) noexcept {
        if (windowSize_ == n) return;
        Window::generate(windowType_, window_.data(), n);
        windowSize_ = n;
    }

    FFT fft_;
    std::vector<float> padded_;
    std::vector<Complex> spectrum_;
    std::vector<float> magnitudes_;
    std::vector<float> window_;
    WindowType windowType_ = WindowType::Rectangular;
    size_t windowSize_ = 0;
    size_t maxSamples_ = 0;
};

} // namespace DSP
} // namespace Wavesum
