// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated FFT via pffft (Pretty Fast FFT).
// Provides forward (real-to-complex) and inverse (complex-to-real) transforms
// for power-of-two sizes. Uses SSE on x86/x64, NEON on ARM, scalar fallback.
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Wavesum {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft minimum for real transforms)
inline constexpr size_t kMinFFTSize = 32;

/// Maximum supported FFT size (2^24, about 5.8 minutes at 48 kHz)
inline constexpr size_t kMaxFFTSize = size_t{1} << 24;

/// @brief Smallest supported FFT size that holds numSamples
/// @return Next power of two >= max(numSamples, kMinFFTSize), or 0 when
///         numSamples exceeds kMaxFFTSize
[[nodiscard]] constexpr size_t fftSizeFor(size_t numSamples) noexcept {
    if (numSamples > kMaxFFTSize) return 0;
    return std::bit_ceil(std::max(numSamples, kMinFFTSize));
}

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note Layout-compatible with interleaved {real, imag} float pairs
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return AlignedBuffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float)))};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real-input Fast Fourier Transform (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @note Leaves the FFT unprepared (isPrepared() == false) on an invalid
    ///       size or allocation failure
    /// @note NOT real-time safe (allocates memory)
    void prepare(size_t fftSize) noexcept {
        release();

        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            return;
        }

        // Allocate SIMD-aligned buffers (16-byte on SSE, as required by pffft)
        buf1_ = detail::makeAlignedBuffer(fftSize);
        buf2_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!buf1_ || !buf2_ || !work_) {
            release();
            return;
        }

        size_ = fftSize;
    }

    /// @brief Reset internal work buffers
    void reset() noexcept {
        if (!isPrepared()) return;
        std::fill_n(buf1_.get(), size_, 0.0f);
        std::fill_n(buf2_.get(), size_, 0.0f);
        std::fill_n(work_.get(), size_, 0.0f);
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist)
    /// @pre prepare() has been called
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;

        std::copy_n(input, N, buf1_.get());

        pffft_transform_ordered(setup_.get(), buf1_.get(), buf2_.get(),
                                work_.get(), PFFFT_FORWARD);

        //   pffft: [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        //   ours:  Complex[0]={DC,0}, Complex[k]={Re,Im}, Complex[N/2]={Nyq,0}
        const float* fftOut = buf2_.get();

        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};

        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief Inverse FFT: complex frequency-domain -> real time-domain
    /// @param input N/2+1 complex bins (DC to Nyquist)
    /// @param output N real samples (normalized: inverse(forward(x)) == x)
    /// @pre prepare() has been called
    void inverse(const Complex* input, float* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        float* fftIn = buf1_.get();

        fftIn[0] = input[0].real;
        fftIn[1] = input[N / 2].real;

        for (size_t k = 1; k < N / 2; ++k) {
            fftIn[2 * k] = input[k].real;
            fftIn[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), fftIn, buf2_.get(),
                                work_.get(), PFFFT_BACKWARD);

        // pffft inverse is unscaled: IFFT(FFT(x)) = N*x
        const float scale = 1.0f / static_cast<float>(N);
        const float* fftOut = buf2_.get();
        for (size_t i = 0; i < N; ++i) {
            output[i] = fftOut[i] * scale;
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ == 0 ? 0 : size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    void release() noexcept {
        size_ = 0;
        setup_.reset();
        buf1_.reset();
        buf2_.reset();
        work_.reset();
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer buf1_;  // Input staging
    detail::AlignedBuffer buf2_;  // Output staging
    detail::AlignedBuffer work_;  // pffft work buffer
};

} // namespace DSP
} // namespace Wavesum
