#include "wav.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr uint16_t format_pcm = 1;
constexpr uint16_t format_extensible = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, std::string_view tag) {
    return std::memcmp(p, tag.data(), 4) == 0;
}

std::vector<uint8_t> encode_pcm(std::span<const uint8_t> pcm, const AudioFormat& fmt) {
    uint16_t channels = fmt.channels;
    uint16_t bits_per_sample = static_cast<uint16_t>(fmt.sample_width * 8);
    uint32_t byte_rate = fmt.sample_rate * channels * fmt.sample_width;
    uint16_t block_align = static_cast<uint16_t>(channels * fmt.sample_width);
    uint32_t data_size = static_cast<uint32_t>(pcm.size());
    uint32_t pad = data_size & 1u;
    uint32_t file_size = 36 + data_size + pad;

    std::vector<uint8_t> out(wav::header_size + data_size + pad);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(format_pcm);
    w16(channels);
    w32(fmt.sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) std::memcpy(out.data() + wav::header_size, pcm.data(), data_size);

    return out;
}

} // namespace

namespace wav {

std::vector<uint8_t> encode(const AudioBuffer& audio) {
    return encode_pcm(audio.data(), audio.format());
}

Result<AudioBuffer> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return make_error(ErrorKind::Parse, "not a RIFF/WAVE stream");
    }

    AudioFormat fmt{};
    bool have_fmt = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* hdr = bytes.data() + pos;
        size_t chunk_size = read_u32(hdr + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (chunk_size < 16 || chunk_size > avail) {
                return make_error(ErrorKind::Parse, "truncated fmt chunk");
            }
            const uint8_t* p = bytes.data() + body;
            uint16_t tag = read_u16(p);
            if (tag == format_extensible && chunk_size >= 40) {
                // Sub-format GUID starts with the real format tag.
                tag = read_u16(p + 24);
            }
            if (tag != format_pcm) {
                return make_error(ErrorKind::Parse, std::format("unsupported WAV format tag {:#x}", tag));
            }
            fmt.channels = read_u16(p + 2);
            fmt.sample_rate = read_u32(p + 4);
            uint16_t bits = read_u16(p + 14);
            fmt.sample_width = static_cast<uint16_t>((bits + 7) / 8);
            if (fmt.channels == 0 || fmt.sample_rate == 0 || fmt.sample_width == 0 || fmt.sample_width > 4) {
                return make_error(ErrorKind::Parse,
                                  std::format("unsupported PCM layout: {} ch, {} Hz, {} bits",
                                              fmt.channels, fmt.sample_rate, bits));
            }
            have_fmt = true;
        } else if (tag_is(hdr, "data")) {
            if (!have_fmt) {
                return make_error(ErrorKind::Parse, "data chunk before fmt chunk");
            }
            // Streaming writers may leave the size at 0xFFFFFFFF.
            size_t len = std::min(chunk_size, avail);
            std::vector<uint8_t> pcm(bytes.begin() + static_cast<std::ptrdiff_t>(body),
                                     bytes.begin() + static_cast<std::ptrdiff_t>(body + len));
            return AudioBuffer(fmt, std::move(pcm));
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    return make_error(ErrorKind::Parse, have_fmt ? "missing data chunk" : "missing fmt chunk");
}

Result<AudioBuffer> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return make_error(ErrorKind::Io, "cannot open " + path);
    }
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) {
        return make_error(ErrorKind::Io, "read failed for " + path);
    }

    auto audio = decode(bytes);
    if (!audio) {
        return make_error(audio.error().kind, path + ": " + audio.error().message);
    }
    return audio;
}

Result<void> write_file(const std::string& path, const AudioBuffer& audio) {
    auto bytes = encode(audio);
    auto tmp_path = path + ".tmp";
    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return make_error(ErrorKind::Io, "cannot write " + tmp_path);
        }
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f) {
            return make_error(ErrorKind::Io, "write failed for " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(tmp_path, ec);
        return make_error(ErrorKind::Io, std::format("cannot replace {}: {}", path, reason));
    }
    return {};
}

} // namespace wav
