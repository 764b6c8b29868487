#pragma once

#include "error.hpp"
#include "transcript_ledger.hpp"

#include <cstdint>
#include <string>
#include <vector>

// How a recording's file path becomes its ledger id.
enum class RecordingIdStyle {
    LjSpeech, // "wavs/name3.wav" -> "name3" (canonical)
    WavsPath, // "wavs/name3.wav" kept as is
};

// On-disk layout of one dataset:
//   <root_path>/<dataset_name>/wavs/*.wav
//   <root_path>/<dataset_name>/metadata.csv
class DatasetWorkspace {
public:
    struct Bootstrap;

    // Creates the dataset directory if needed and rebuilds the ledger from
    // the WAV files already present.
    //
    // When both wavs/ and metadata.csv exist, every wavs/*.wav in natural
    // order whose id appears in metadata.csv contributes one entry; the id is
    // looked up in path form ("wavs/u1.wav") and then in stripped form ("u1").
    // Files without a ledger line are skipped. Otherwise the ledger is empty.
    // A name containing '|' or '/', or with surrounding whitespace, is a
    // Workspace error.
    static Result<Bootstrap> bootstrap(const std::string& root_path, const std::string& dataset_name);

    const std::string& root() const { return root_; }
    const std::string& name() const { return name_; }
    std::string wavs_dir() const;
    std::string metadata_path() const;

    // wavs/{dataset_name}{sequence}.wav under the dataset root.
    std::string recording_path(uint32_t sequence) const;

    // Id of `file` (absolute or root-relative) in the requested style.
    std::string recording_id(const std::string& file, RecordingIdStyle style) const;

    // Resolves an id of either style back to its WAV file.
    std::string audio_path(const std::string& recording_id) const;

    // ledger.size() + 1, advanced past any file that already exists so a
    // new recording never overwrites an old one.
    uint32_t next_sequence_number(const TranscriptLedger& ledger) const;

    // WAV file names under wavs/, natural order.
    Result<std::vector<std::string>> list_recordings() const;

private:
    DatasetWorkspace(std::string root, std::string name)
        : root_(std::move(root)), name_(std::move(name)) {}

    std::string root_;
    std::string name_;
};

struct DatasetWorkspace::Bootstrap {
    DatasetWorkspace workspace;
    TranscriptLedger ledger;
};
