#pragma once

#include "config.hpp"
#include "dataset_workspace.hpp"
#include "error.hpp"
#include "platform/capture_device.hpp"
#include "recording_session.hpp"
#include "sentence_generator.hpp"
#include "silence_trimmer.hpp"
#include "transcript_ledger.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>

// Everything one front end needs: the open dataset, its ledger, the sentence
// sources, the current prompt and the recording session. Front ends read
// state from here and dispatch commands to it; nothing else holds state.
class CorpusCore {
public:
    CorpusCore(Config config, bool verbose, CaptureDevice& device);
    CorpusCore(Config config, bool verbose, CaptureDevice& device, uint32_t seed);

    CorpusCore(const CorpusCore&) = delete;
    CorpusCore& operator=(const CorpusCore&) = delete;

    // Registers the configured sources and opens the configured dataset, if
    // any. Unreadable sources are reported and skipped.
    bool init();

    // Bootstraps root/name and rewrites metadata.csv with the reconciled
    // ledger. Refused while recording.
    Result<void> open_dataset(const std::string& root, const std::string& name);
    bool has_dataset() const { return workspace_.has_value(); }
    const DatasetWorkspace* workspace() const { return workspace_ ? &*workspace_ : nullptr; }
    const TranscriptLedger& ledger() const { return ledger_; }

    // A source whose origin is already registered is ignored.
    Result<void> add_source(const std::string& path);
    bool remove_source(const std::string& origin);
    const SentenceGenerator& generator() const { return generator_; }

    // Picks a new prompt; empty when no source is registered.
    std::optional<std::string> generate();
    void set_prompt(std::string text);
    const std::string& prompt() const { return prompt_; }

    // Recording needs an open dataset and a prompt.
    bool can_record() const;

    Result<void> start_recording();
    Result<void> poll();
    // Writes the WAV, appends (id, prompt) and persists the ledger.
    Result<Utterance> stop_recording();
    void abort_recording();

    // Removes the entry and persists the ledger. The WAV file stays on disk.
    Result<void> remove_entry(size_t index);

    Result<TrimReport> trim_silence(std::stop_token stop,
                                    const SilenceTrimmer::ProgressCallback& progress = {}) const;

    SessionState session_state() const { return session_.state(); }
    double recording_duration() const { return session_.recording_duration(); }
    const Config& config() const { return config_; }

    nlohmann::json status() const;

    void shutdown();

private:
    void log(const std::string& msg) const;

    Config config_;
    bool verbose_;

    CaptureDevice& device_;
    RecordingSession session_;
    SentenceGenerator generator_;
    SilenceTrimmer trimmer_;

    std::optional<DatasetWorkspace> workspace_;
    TranscriptLedger ledger_;
    std::string prompt_;
};
