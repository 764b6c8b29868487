#include "recording_session.hpp"

#include "audio_buffer.hpp"
#include "wav.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

RecordingSession::RecordingSession(CaptureDevice& device, RecordingIdStyle id_style)
    : device_(device), id_style_(id_style) {}

Result<void> RecordingSession::start(const DeviceConfig& config) {
    if (state_ != SessionState::Idle) {
        return make_error(ErrorKind::State, "session: cannot start, already recording");
    }

    const DeviceConfig fixed;
    if (config.sample_rate != fixed.sample_rate || config.channels != fixed.channels ||
        config.sample_width != fixed.sample_width) {
        return make_error(ErrorKind::Device,
                          std::format("session: capture must be {} Hz mono 16-bit, got {} Hz {} ch {}-byte",
                                      fixed.sample_rate, config.sample_rate, config.channels,
                                      config.sample_width));
    }

    if (auto res = device_.open(config); !res) {
        std::println(stderr, "session: failed to open capture device: {}", res.error().message);
        return res;
    }

    config_ = config;
    chunks_.clear();
    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return {};
}

Result<void> RecordingSession::poll_tick() {
    if (state_ != SessionState::Recording) {
        return make_error(ErrorKind::State, "session: poll while idle");
    }

    auto chunk = device_.read(config_.frames_per_buffer);
    if (!chunk) {
        std::println(stderr, "session: capture read failed: {}", chunk.error().message);
        finish();
        return std::unexpected(chunk.error());
    }

    if (!chunk->empty()) chunks_.push_back(std::move(*chunk));
    return {};
}

Result<Utterance> RecordingSession::stop(const DatasetWorkspace& workspace, uint32_t sequence,
                                         std::string transcription) {
    if (state_ != SessionState::Recording) {
        return make_error(ErrorKind::State, "session: cannot stop, not recording");
    }

    // Last read picks up whatever the device still buffers.
    if (auto res = poll_tick(); !res) {
        return std::unexpected(res.error());
    }

    std::vector<int16_t> samples;
    samples.reserve(captured_frames() * config_.channels);
    for (const auto& chunk : chunks_) {
        samples.insert(samples.end(), chunk.begin(), chunk.end());
    }
    finish();

    std::error_code ec;
    fs::create_directories(workspace.wavs_dir(), ec);
    if (ec) {
        return make_error(ErrorKind::Workspace,
                          std::format("cannot create {}: {}", workspace.wavs_dir(), ec.message()));
    }

    auto path = workspace.recording_path(sequence);
    if (auto res = wav::write_file(path, AudioBuffer::from_samples(samples, config_.sample_rate)); !res) {
        return std::unexpected(res.error());
    }

    return Utterance{workspace.recording_id(path, id_style_), std::move(transcription)};
}

void RecordingSession::abort() {
    if (state_ != SessionState::Recording) return;
    finish();
}

void RecordingSession::finish() {
    device_.close();
    chunks_.clear();
    state_ = SessionState::Idle;
}

double RecordingSession::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

size_t RecordingSession::captured_frames() const {
    size_t samples = 0;
    for (const auto& chunk : chunks_) samples += chunk.size();
    return config_.channels == 0 ? 0 : samples / config_.channels;
}
