#include <catch2/catch_test_macros.hpp>

#include "audio/resampler.hpp"

#include <cmath>
#include <vector>

TEST_CASE("resample_to_16k_mono", "[resampler]") {

    SECTION("EmptyInput") {
        REQUIRE(resample_to_16k_mono({}, 48000, 2).empty());
    }

    SECTION("InvalidFormat") {
        std::vector<float> in(100, 0.5f);
        REQUIRE(resample_to_16k_mono(in, 0, 1).empty());
        REQUIRE(resample_to_16k_mono(in, 16000, 0).empty());
    }

    SECTION("CanonicalPassthrough") {
        std::vector<float> in = {0.1f, -0.2f, 0.3f, -0.4f};
        REQUIRE(resample_to_16k_mono(in, 16000, 1) == in);
    }

    SECTION("StereoMixedToMean") {
        std::vector<float> in = {1.0f, 0.0f, 1.0f, 0.0f};
        auto out = resample_to_16k_mono(in, 16000, 2);
        REQUIRE(out == std::vector<float>{0.5f, 0.5f});
    }

    SECTION("IncompleteTrailingFrameDropped") {
        std::vector<float> in = {0.2f, 0.4f, 0.6f, 0.8f, 1.0f};
        auto out = resample_to_16k_mono(in, 16000, 2);
        REQUIRE(out.size() == 2);
    }

    SECTION("Downsample48k") {
        std::vector<float> in(48000, 0.25f);
        auto out = resample_to_16k_mono(in, 48000, 1);
        REQUIRE(out.size() >= 15999);
        REQUIRE(out.size() <= 16001);
        for (float s : out) {
            REQUIRE(std::fabs(s - 0.25f) < 1e-6f);
        }
    }

    SECTION("Downsample44k1Stereo") {
        std::vector<float> in(44100 * 2, 0.0f);
        auto out = resample_to_16k_mono(in, 44100, 2);
        REQUIRE(out.size() >= 15999);
        REQUIRE(out.size() <= 16001);
    }

    SECTION("Upsample8kInterpolates") {
        std::vector<float> in = {0.0f, 1.0f, 0.0f, 1.0f};
        auto out = resample_to_16k_mono(in, 8000, 1);
        REQUIRE(out.size() == 8);
        REQUIRE(out[0] == 0.0f);
        REQUIRE(std::fabs(out[1] - 0.5f) < 1e-6f);
        REQUIRE(out[2] == 1.0f);
    }
}
