#include <catch2/catch_test_macros.hpp>

#include "silence_trimmer.hpp"
#include "test_support.hpp"
#include "wav.hpp"

#include <stop_token>
#include <string>
#include <utility>
#include <vector>

TEST_CASE("Leading silence detection", "[trim]") {

    SECTION("StopsAtFirstLoudChunk") {
        auto audio = test::padded_tone(16000, 200, 500, 300);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio) == 200);
    }

    SECTION("LoudStartIsZero") {
        auto audio = test::padded_tone(16000, 0, 100, 0);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio) == 0);
    }

    SECTION("AllSilentReturnsLength") {
        auto audio = test::padded_tone(22050, 105, 0, 0);
        REQUIRE(audio.length_ms() == 105);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio) == 105);
        REQUIRE(SilenceTrimmer::detect_leading_silence(AudioBuffer()) == 0);
    }

    SECTION("QuietNoiseCountsAsSilence") {
        std::vector<int16_t> samples(1600, 100); // about -50 dBFS
        std::vector<int16_t> loud(1600, 500);    // about -36 dBFS
        samples.insert(samples.end(), loud.begin(), loud.end());
        auto audio = AudioBuffer::from_samples(samples, 16000);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio) == 100);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio, -60.0) == 0);
    }

    SECTION("ChunkSizeQuantizesResult") {
        auto audio = test::padded_tone(16000, 25, 100, 0);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio, -40.0, 10) == 20);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio, -40.0, 1) == 25);
        REQUIRE(SilenceTrimmer::detect_leading_silence(audio, -40.0, 0) == 25);
    }
}

TEST_CASE("Silence trim", "[trim]") {
    SilenceTrimmer trimmer;

    SECTION("RemovesBothEnds") {
        auto audio = test::padded_tone(16000, 200, 500, 300);
        auto trimmed = trimmer.trim(audio);
        REQUIRE(trimmed.frame_count() == 500 * 16);
        REQUIRE(trimmed.format() == audio.format());
        REQUIRE(SilenceTrimmer::detect_leading_silence(trimmed) == 0);
    }

    SECTION("Idempotent") {
        auto audio = test::padded_tone(16000, 120, 300, 80);
        auto once = trimmer.trim(audio);
        auto twice = trimmer.trim(once);
        REQUIRE(twice == once);
    }

    SECTION("AllSilentBecomesEmpty") {
        auto audio = test::padded_tone(16000, 300, 0, 0);
        auto trimmed = trimmer.trim(audio);
        REQUIRE(trimmed.empty());
        REQUIRE(trimmed.format() == audio.format());
    }

    SECTION("NothingToTrim") {
        auto audio = test::padded_tone(16000, 0, 200, 0);
        REQUIRE(trimmer.trim(audio) == audio);
    }
}

TEST_CASE("Silence trim batch", "[trim]") {
    test::TmpDir tmp;
    auto boot = DatasetWorkspace::bootstrap(tmp.str(), "ds");
    REQUIRE(boot);
    const auto& ws = boot->workspace;

    auto padded = test::padded_tone(16000, 200, 500, 300);
    TranscriptLedger ledger;
    for (uint32_t seq = 1; seq <= 3; ++seq) {
        test::write_wav(ws.recording_path(seq), padded);
        ledger.append("ds" + std::to_string(seq), "sentence " + std::to_string(seq));
    }
    const auto original = test::read_text(ws.recording_path(1));

    SilenceTrimmer trimmer;
    std::stop_source source;

    SECTION("TrimsEveryEntry") {
        std::vector<std::pair<TrimPhase, size_t>> seen;
        auto report = trimmer.run_batch(ledger, ws, source.get_token(), [&](const TrimProgress& p) {
            REQUIRE(p.total == 3);
            seen.emplace_back(p.phase, p.index);
        });
        REQUIRE(report);
        REQUIRE(report->computed == 3);
        REQUIRE(report->written == 3);
        REQUIRE_FALSE(report->cancelled);
        REQUIRE(seen.size() == 6);
        REQUIRE(seen.front().first == TrimPhase::Compute);
        REQUIRE(seen.front().second == 0);
        REQUIRE(seen.back().first == TrimPhase::Write);
        REQUIRE(seen.back().second == 2);

        for (uint32_t seq = 1; seq <= 3; ++seq) {
            auto audio = wav::read_file(ws.recording_path(seq));
            REQUIRE(audio);
            REQUIRE(audio->frame_count() == 500 * 16);
            REQUIRE(audio->format() == padded.format());
        }
    }

    SECTION("WavsPathIdsResolve") {
        TranscriptLedger path_ledger;
        path_ledger.append("wavs/ds2.wav", "two");
        auto report = trimmer.run_batch(path_ledger, ws, source.get_token());
        REQUIRE(report);
        REQUIRE(report->written == 1);
        REQUIRE(wav::read_file(ws.recording_path(2))->frame_count() == 500 * 16);
        REQUIRE(test::read_text(ws.recording_path(1)) == original);
    }

    SECTION("CancelDuringComputeWritesNothing") {
        size_t computes = 0;
        auto report = trimmer.run_batch(ledger, ws, source.get_token(), [&](const TrimProgress& p) {
            if (p.phase == TrimPhase::Compute && ++computes == 2) source.request_stop();
        });
        REQUIRE(report);
        REQUIRE(report->cancelled);
        REQUIRE(report->computed == 2);
        REQUIRE(report->written == 0);
        for (uint32_t seq = 1; seq <= 3; ++seq) {
            REQUIRE(test::read_text(ws.recording_path(seq)) == original);
        }
    }

    SECTION("CancelAfterLastComputeWritesNothing") {
        auto report = trimmer.run_batch(ledger, ws, source.get_token(), [&](const TrimProgress& p) {
            if (p.phase == TrimPhase::Compute && p.index == 2) source.request_stop();
        });
        REQUIRE(report);
        REQUIRE(report->cancelled);
        REQUIRE(report->computed == 3);
        REQUIRE(report->written == 0);
        REQUIRE(test::read_text(ws.recording_path(3)) == original);
    }

    SECTION("CancelDuringWriteKeepsWrittenFiles") {
        auto report = trimmer.run_batch(ledger, ws, source.get_token(), [&](const TrimProgress& p) {
            if (p.phase == TrimPhase::Write && p.index == 0) source.request_stop();
        });
        REQUIRE(report);
        REQUIRE(report->cancelled);
        REQUIRE(report->written == 1);
        REQUIRE(wav::read_file(ws.recording_path(1))->frame_count() == 500 * 16);
        REQUIRE(test::read_text(ws.recording_path(2)) == original);
        REQUIRE(test::read_text(ws.recording_path(3)) == original);
    }

    SECTION("StoppedBeforeStartDoesNothing") {
        source.request_stop();
        auto report = trimmer.run_batch(ledger, ws, source.get_token());
        REQUIRE(report);
        REQUIRE(report->cancelled);
        REQUIRE(report->computed == 0);
    }

    SECTION("DecodeFailureAbortsWithoutWriting") {
        test::write_text(ws.recording_path(2), "not a wav file");
        auto report = trimmer.run_batch(ledger, ws, source.get_token());
        REQUIRE_FALSE(report);
        REQUIRE(report.error().kind == ErrorKind::Parse);
        REQUIRE(test::read_text(ws.recording_path(1)) == original);
    }

    SECTION("MissingFileIsIoError") {
        ledger.append("ds9", "never recorded");
        auto report = trimmer.run_batch(ledger, ws, source.get_token());
        REQUIRE_FALSE(report);
        REQUIRE(report.error().kind == ErrorKind::Io);
        REQUIRE(test::read_text(ws.recording_path(1)) == original);
    }

    SECTION("EmptyLedger") {
        auto report = trimmer.run_batch(TranscriptLedger{}, ws, source.get_token());
        REQUIRE(report);
        REQUIRE(report->computed == 0);
        REQUIRE(report->written == 0);
        REQUIRE_FALSE(report->cancelled);
    }
}
