// ==============================================================================
// Demo Tool Tests - Command Line Options
// ==============================================================================
// Tests for: tools/include/wavesum/tools/demo_options.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <wavesum/tools/demo_options.h>

#include <cstddef>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace Wavesum::Tools;
using Wavesum::DSP::AmplitudeMeasure;
using Wavesum::DSP::WindowType;

namespace {

bool parseArgs(std::vector<const char*> args, DemoOptions& options, std::string& diagnostics) {
    args.insert(args.begin(), "wavesum_demo");
    std::ostringstream err;
    const bool ok = parseOptions(static_cast<int>(args.size()), args.data(), options, err);
    diagnostics = err.str();
    return ok;
}

} // namespace

TEST_CASE("defaults reproduce the usage example", "[tools][demo_options]") {
    DemoOptions options;
    std::string diagnostics;
    REQUIRE(parseArgs({}, options, diagnostics));

    REQUIRE(options.config.level1Db == 60.0f);
    REQUIRE(options.config.level2Db == 80.0f);
    REQUIRE(options.config.angularFrequency1 == 100.0);
    REQUIRE(options.config.angularFrequency2 == 200.0);
    REQUIRE(options.start == 0.0);
    REQUIRE(options.stop == 10.0);
    REQUIRE(options.samples == 1000);
    REQUIRE_FALSE(options.dump);
}

TEST_CASE("flags override the defaults", "[tools][demo_options]") {
    DemoOptions options;
    std::string diagnostics;
    REQUIRE(parseArgs({"--db1", "20", "--w2", "-50.5", "--phi2", "3.14", "--samples", "4096",
                       "--measure", "rms", "--window", "hann", "--dump"},
                      options, diagnostics));

    REQUIRE(options.config.level1Db == 20.0f);
    REQUIRE(options.config.angularFrequency2 == -50.5);
    REQUIRE(options.config.phase2 == 3.14);
    REQUIRE(options.samples == 4096);
    REQUIRE(options.config.amplitudeMeasure == AmplitudeMeasure::Rms);
    REQUIRE(options.config.window == WindowType::Hann);
    REQUIRE(options.dump);
    REQUIRE(diagnostics.empty());
}

TEST_CASE("parseCount accepts only whole numbers in range", "[tools][demo_options]") {
    size_t count = 7;

    SECTION("plain whole numbers") {
        REQUIRE(parseCount("0", count));
        REQUIRE(count == 0);
        REQUIRE(parseCount("65537", count));
        REQUIRE(count == 65537);
    }

    SECTION("fractions and exponents are rejected") {
        REQUIRE_FALSE(parseCount("1.5", count));
        REQUIRE_FALSE(parseCount("1e3", count));
        REQUIRE(count == 7);
    }

    SECTION("signs, blanks and junk are rejected") {
        REQUIRE_FALSE(parseCount("-1", count));
        REQUIRE_FALSE(parseCount("+5", count));
        REQUIRE_FALSE(parseCount(" 5", count));
        REQUIRE_FALSE(parseCount("", count));
        REQUIRE_FALSE(parseCount("12abc", count));
        REQUIRE(count == 7);
    }

    SECTION("values beyond size_t are rejected") {
        const std::string tooLarge = std::to_string(std::numeric_limits<size_t>::max()) + "0";
        REQUIRE_FALSE(parseCount(tooLarge, count));
        REQUIRE_FALSE(parseCount("1000000000000000000000000000000", count));
        REQUIRE(count == 7);
    }
}

TEST_CASE("invalid sample counts stop parsing with a diagnostic", "[tools][demo_options]") {
    for (const char* bad : {"1.5", "-3", "1e30", "99999999999999999999999"}) {
        INFO("--samples " << bad);
        DemoOptions options;
        std::string diagnostics;
        REQUIRE_FALSE(parseArgs({"--samples", bad}, options, diagnostics));
        REQUIRE(options.samples == 1000);
        REQUIRE(diagnostics.find("--samples") != std::string::npos);
    }
}

TEST_CASE("malformed options are reported", "[tools][demo_options]") {
    DemoOptions options;
    std::string diagnostics;

    SECTION("missing value") {
        REQUIRE_FALSE(parseArgs({"--db1"}, options, diagnostics));
        REQUIRE(diagnostics.find("Missing value") != std::string::npos);
    }

    SECTION("non-numeric value") {
        REQUIRE_FALSE(parseArgs({"--w1", "fast"}, options, diagnostics));
        REQUIRE(diagnostics.find("Invalid number") != std::string::npos);
    }

    SECTION("unknown choice") {
        REQUIRE_FALSE(parseArgs({"--window", "blackman"}, options, diagnostics));
        REQUIRE(diagnostics.find("Unknown window") != std::string::npos);
    }

    SECTION("unknown flag") {
        REQUIRE_FALSE(parseArgs({"--volume", "3"}, options, diagnostics));
        REQUIRE(diagnostics.find("Unknown option") != std::string::npos);
    }

    SECTION("help") {
        REQUIRE_FALSE(parseArgs({"--help"}, options, diagnostics));
    }
}
