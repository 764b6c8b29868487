#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "audio_buffer.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("AudioBuffer", "[audio_buffer]") {

    SECTION("FromSamples") {
        std::vector<int16_t> samples(441, 0);
        auto audio = AudioBuffer::from_samples(samples, 22050);
        REQUIRE(audio.format() == AudioFormat{});
        REQUIRE(audio.frame_count() == 441);
        REQUIRE(audio.length_ms() == 20);
    }

    SECTION("TrailingPartialFrameDropped") {
        AudioBuffer audio(AudioFormat{.sample_rate = 8000, .channels = 2, .sample_width = 2},
                          std::vector<uint8_t>(11, 0));
        REQUIRE(audio.data().size() == 8);
        REQUIRE(audio.frame_count() == 2);
    }

    SECTION("LengthIsRounded") {
        REQUIRE(AudioBuffer::from_samples(std::vector<int16_t>(11, 0), 22050).length_ms() == 0);
        REQUIRE(AudioBuffer::from_samples(std::vector<int16_t>(12, 0), 22050).length_ms() == 1);
        REQUIRE(AudioBuffer().length_ms() == 0);
        REQUIRE(AudioBuffer().empty());
    }

    SECTION("SliceByMilliseconds") {
        auto audio = test::padded_tone(22050, 100, 100, 100);
        REQUIRE(audio.slice(0, 10).frame_count() == 220);
        REQUIRE(audio.slice(100, 200).frame_count() == 2205);
        REQUIRE(audio.slice(250, 10000).frame_count() == audio.frame_count() - 5512);
        REQUIRE(audio.slice(200, 100).empty());
        REQUIRE(audio.slice(500, 600).empty());
        REQUIRE(audio.slice(0, 10).format() == audio.format());
    }

    SECTION("ReversedKeepsChannelOrder") {
        AudioFormat stereo{.sample_rate = 8000, .channels = 2, .sample_width = 2};
        std::vector<int16_t> samples = {1, 2, 3, 4, 5, 6};
        std::vector<uint8_t> pcm(samples.size() * 2);
        std::memcpy(pcm.data(), samples.data(), pcm.size());

        auto rev = AudioBuffer(stereo, pcm).reversed();
        std::vector<int16_t> out(6);
        std::memcpy(out.data(), rev.data().data(), rev.data().size());
        REQUIRE(out == std::vector<int16_t>{5, 6, 3, 4, 1, 2});
    }

    SECTION("RmsIsInteger") {
        std::vector<int16_t> samples = {3, -4, 3, -4};
        auto audio = AudioBuffer::from_samples(samples, 22050);
        // sqrt(12.5) truncated
        REQUIRE(audio.rms() == 3.0);
    }

    SECTION("DbfsOfFullScaleSquare") {
        std::vector<int16_t> samples = {32767, -32768, 32767, -32768};
        auto audio = AudioBuffer::from_samples(samples, 22050);
        REQUIRE_THAT(audio.dbfs(), WithinAbs(0.0, 0.001));
    }

    SECTION("DbfsOfTone") {
        auto audio = test::padded_tone(22050, 0, 50, 0, 16000);
        REQUIRE(audio.rms() == 16000.0);
        REQUIRE_THAT(audio.dbfs(), WithinAbs(20.0 * std::log10(16000.0 / 32768.0), 1e-9));
    }

    SECTION("SilenceIsNegativeInfinity") {
        auto audio = AudioBuffer::from_samples(std::vector<int16_t>(100, 0), 22050);
        REQUIRE(std::isinf(audio.dbfs()));
        REQUIRE(audio.dbfs() < 0);
        REQUIRE(std::isinf(AudioBuffer().dbfs()));
    }

    SECTION("EightBitIsUnsigned") {
        AudioFormat fmt{.sample_rate = 8000, .channels = 1, .sample_width = 1};
        REQUIRE(std::isinf(AudioBuffer(fmt, std::vector<uint8_t>(16, 128)).dbfs()));
        REQUIRE(AudioBuffer(fmt, std::vector<uint8_t>(16, 0)).rms() == 128.0);
        REQUIRE(AudioBuffer(fmt, {}).max_possible_amplitude() == 128.0);
    }

    SECTION("TwentyFourBitIsSignExtended") {
        AudioFormat fmt{.sample_rate = 8000, .channels = 1, .sample_width = 3};
        // -1 and +1
        AudioBuffer audio(fmt, {0xFF, 0xFF, 0xFF, 0x01, 0x00, 0x00});
        REQUIRE(audio.rms() == 1.0);
        REQUIRE(audio.max_possible_amplitude() == 8388608.0);
    }
}
