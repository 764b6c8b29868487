#include "silence_trimmer.hpp"

#include "wav.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>
#include <vector>

SilenceTrimmer::SilenceTrimmer(TrimOptions options) : options_(options) {}

size_t SilenceTrimmer::detect_leading_silence(const AudioBuffer& audio, double threshold_dbfs,
                                              size_t chunk_ms) {
    if (chunk_ms == 0) chunk_ms = 1;

    const size_t length = audio.length_ms();
    size_t trim_ms = 0;
    while (trim_ms < length && audio.slice(trim_ms, trim_ms + chunk_ms).dbfs() < threshold_dbfs) {
        trim_ms += chunk_ms;
    }
    return std::min(trim_ms, length);
}

AudioBuffer SilenceTrimmer::trim(const AudioBuffer& audio) const {
    const size_t length = audio.length_ms();
    size_t start = detect_leading_silence(audio, options_.threshold_dbfs, options_.chunk_ms);
    size_t end = detect_leading_silence(audio.reversed(), options_.threshold_dbfs, options_.chunk_ms);

    if (start >= length - end) return audio.slice(0, 0);
    return audio.slice(start, length - end);
}

Result<TrimReport> SilenceTrimmer::run_batch(const TranscriptLedger& ledger,
                                             const DatasetWorkspace& workspace,
                                             std::stop_token stop,
                                             const ProgressCallback& progress) const {
    TrimReport report;
    const auto& entries = ledger.entries();
    const size_t total = entries.size();

    // Phase 1: compute only.
    std::vector<std::pair<std::string, AudioBuffer>> trimmed;
    trimmed.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        if (stop.stop_requested()) {
            report.cancelled = true;
            return report;
        }
        if (progress) progress(TrimProgress{TrimPhase::Compute, i, total, entries[i].recording_id});

        auto path = workspace.audio_path(entries[i].recording_id);
        auto audio = wav::read_file(path);
        if (!audio) {
            std::println(stderr, "trim: cannot decode {}, nothing written", path);
            return std::unexpected(audio.error());
        }

        trimmed.emplace_back(path, trim(*audio));
        report.computed++;
    }

    // Phase 2: overwrite sources.
    for (size_t i = 0; i < trimmed.size(); ++i) {
        if (stop.stop_requested()) {
            report.cancelled = true;
            return report;
        }
        if (progress) progress(TrimProgress{TrimPhase::Write, i, total, entries[i].recording_id});

        const auto& [path, audio] = trimmed[i];
        if (auto res = wav::write_file(path, audio); !res) {
            return make_error(res.error().kind,
                              std::format("{} ({} of {} files already written)",
                                          res.error().message, report.written, total));
        }
        report.written++;
    }

    return report;
}
