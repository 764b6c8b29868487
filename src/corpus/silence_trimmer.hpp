#pragma once

#include "audio_buffer.hpp"
#include "dataset_workspace.hpp"
#include "error.hpp"
#include "transcript_ledger.hpp"

#include <cstddef>
#include <functional>
#include <stop_token>
#include <string>

struct TrimOptions {
    double threshold_dbfs = -40.0;
    size_t chunk_ms = 10; // 0 is treated as 1
};

enum class TrimPhase { Compute, Write };

struct TrimProgress {
    TrimPhase phase;
    size_t index;
    size_t total;
    const std::string& recording_id;
};

struct TrimReport {
    size_t computed = 0;
    size_t written = 0;
    bool cancelled = false;
};

// Removes leading and trailing silence from recordings.
class SilenceTrimmer {
public:
    using ProgressCallback = std::function<void(const TrimProgress&)>;

    explicit SilenceTrimmer(TrimOptions options = {});

    // Milliseconds of silence at the start of `audio`. Scans non-overlapping
    // chunk_ms windows from the start while each window is strictly quieter
    // than threshold_dbfs. Never exceeds audio.length_ms().
    static size_t detect_leading_silence(const AudioBuffer& audio, double threshold_dbfs = -40.0,
                                         size_t chunk_ms = 10);

    // audio[start : length - end], where end is the leading silence of the
    // reversed audio. Fully silent input yields an empty buffer.
    AudioBuffer trim(const AudioBuffer& audio) const;

    // Two-phase batch over every ledger entry, in ledger order.
    //
    // Phase 1 decodes and trims each file in memory. Phase 2 writes every
    // result back over its source in the same PCM format. Cancellation is
    // checked before each phase 1 entry, before phase 2 and before each write:
    // a stop before phase 2 writes nothing, a stop during phase 2 keeps the
    // files already written and leaves the rest untouched. A decode failure in
    // phase 1 aborts with nothing written. There is no timeout.
    Result<TrimReport> run_batch(const TranscriptLedger& ledger, const DatasetWorkspace& workspace,
                                 std::stop_token stop, const ProgressCallback& progress = {}) const;

    const TrimOptions& options() const { return options_; }

private:
    TrimOptions options_;
};
