#pragma once

#include "audio_buffer.hpp"
#include "error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE container for uncompressed PCM.
namespace wav {

constexpr size_t header_size = 44;

// Encodes any PCM buffer, keeping its rate, width and channel count.
std::vector<uint8_t> encode(const AudioBuffer& audio);

// Accepts PCM (format tag 1) and WAVE_FORMAT_EXTENSIBLE with a PCM
// sub-format, 8 to 32 bits. Unknown chunks are skipped.
Result<AudioBuffer> decode(std::span<const uint8_t> bytes);

Result<AudioBuffer> read_file(const std::string& path);

// Replaces `path` with the encoded buffer via a temporary file and rename.
Result<void> write_file(const std::string& path, const AudioBuffer& audio);

} // namespace wav
