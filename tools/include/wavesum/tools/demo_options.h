// ==============================================================================
// Wave Superposition Demo - Command Line Options
// ==============================================================================
// Flag parsing for wavesum_demo. Diagnostics go to the supplied stream so the
// tool prints them on std::cerr and tests can inspect them.
// ==============================================================================

#pragma once

#include <wavesum/dsp/systems/wave_superposer.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <string>

namespace Wavesum {
namespace Tools {

struct DemoOptions {
    DSP::SuperposerConfig config{60.0f, 80.0f, 100.0, 200.0};
    double start = 0.0;
    double stop = 10.0;
    size_t samples = 1000;
    bool dump = false;
};

/// @brief Parse a whole decimal string as a double
/// @return false on empty input or trailing characters; value untouched
inline bool parseDouble(const std::string& text, double& value) {
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (text.empty() || end == nullptr || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

/// @brief Parse a non-negative whole number that fits in size_t
/// @return false for signs, fractions, exponents, trailing characters or
///         values out of range; value untouched
inline bool parseCount(const std::string& text, size_t& value) {
    if (text.empty() || text.front() < '0' || text.front() > '9') {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }
    if (parsed > std::numeric_limits<size_t>::max()) {
        return false;
    }
    value = static_cast<size_t>(parsed);
    return true;
}

/// @brief Apply argv flags on top of the defaults in options
/// @return false on --help or any invalid flag (reason written to err)
inline bool parseOptions(int argc, const char* const argv[], DemoOptions& options,
                         std::ostream& err) {
    using DSP::AmplitudeMeasure;
    using DSP::WindowType;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--dump") {
            options.dump = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            err << "Missing value for " << arg << std::endl;
            return false;
        }

        const std::string value = argv[++i];

        if (arg == "--measure") {
            if (value == "peak") options.config.amplitudeMeasure = AmplitudeMeasure::Peak;
            else if (value == "rms") options.config.amplitudeMeasure = AmplitudeMeasure::Rms;
            else if (value == "bin") options.config.amplitudeMeasure = AmplitudeMeasure::DominantBin;
            else {
                err << "Unknown amplitude measure: " << value << std::endl;
                return false;
            }
            continue;
        }
        if (arg == "--window") {
            if (value == "rect") options.config.window = WindowType::Rectangular;
            else if (value == "hann") options.config.window = WindowType::Hann;
            else {
                err << "Unknown window: " << value << std::endl;
                return false;
            }
            continue;
        }
        if (arg == "--samples") {
            if (!parseCount(value, options.samples)) {
                err << "--samples needs a non-negative whole number: " << value << std::endl;
                return false;
            }
            continue;
        }

        double number = 0.0;
        if (!parseDouble(value, number)) {
            err << "Invalid number for " << arg << ": " << value << std::endl;
            return false;
        }

        if (arg == "--db1") options.config.level1Db = static_cast<float>(number);
        else if (arg == "--db2") options.config.level2Db = static_cast<float>(number);
        else if (arg == "--w1") options.config.angularFrequency1 = number;
        else if (arg == "--w2") options.config.angularFrequency2 = number;
        else if (arg == "--phi1") options.config.phase1 = number;
        else if (arg == "--phi2") options.config.phase2 = number;
        else if (arg == "--start") options.start = number;
        else if (arg == "--stop") options.stop = number;
        else {
            err << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace Tools
} // namespace Wavesum
