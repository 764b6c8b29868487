#pragma once

#include "dataset_workspace.hpp"
#include "error.hpp"
#include "platform/capture_device.hpp"
#include "transcript_ledger.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum class SessionState { Idle, Recording };

// Drives one capture device through Idle -> Recording -> Idle, any number of
// times. The caller's loop calls poll_tick() while recording; every command
// issued in the wrong state fails with a State error and changes nothing.
class RecordingSession {
public:
    explicit RecordingSession(CaptureDevice& device,
                              RecordingIdStyle id_style = RecordingIdStyle::LjSpeech);

    // Opens the device and clears the chunk list. Capture is fixed at
    // 22050 Hz mono 16-bit; any other format is a Device error. Stays Idle on
    // failure.
    Result<void> start(const DeviceConfig& config = {});

    // Reads one buffer from the device and appends it. A read failure closes
    // the device, discards the chunks and returns the session to Idle.
    Result<void> poll_tick();

    // Flushes one last buffer, closes the device and writes
    // wavs/{dataset_name}{sequence}.wav, creating wavs/ if needed. A session
    // that captured nothing still writes a valid WAV with no frames. Always
    // ends Idle.
    Result<Utterance> stop(const DatasetWorkspace& workspace, uint32_t sequence,
                           std::string transcription);

    // Closes the device and drops the chunks without writing anything.
    void abort();

    SessionState state() const { return state_; }
    double recording_duration() const;
    size_t captured_frames() const;
    size_t chunk_count() const { return chunks_.size(); }
    RecordingIdStyle id_style() const { return id_style_; }

private:
    void finish();

    CaptureDevice& device_;
    RecordingIdStyle id_style_;
    DeviceConfig config_;
    SessionState state_ = SessionState::Idle;
    std::vector<std::vector<int16_t>> chunks_;
    std::chrono::steady_clock::time_point record_start_;
};
