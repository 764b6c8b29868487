#include "transcript_ledger.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

// Calls on_entry(id, transcription) for every non-blank line of `path`.
template <typename F>
Result<void> read_lines(const std::string& path, F&& on_entry) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return make_error(ErrorKind::Io, "cannot open ledger " + path);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(f, line)) {
        line_no++;
        if (trim(line).empty()) continue;

        auto bar = line.find('|');
        if (bar == std::string::npos) {
            return make_error(ErrorKind::Parse,
                              std::format("{}:{}: missing '|' delimiter in \"{}\"", path, line_no, line));
        }
        on_entry(trim(std::string_view(line).substr(0, bar)),
                 trim(std::string_view(line).substr(bar + 1)));
    }

    if (f.bad()) {
        return make_error(ErrorKind::Io, "read failed for ledger " + path);
    }
    return {};
}

} // namespace

void TranscriptLedger::append(std::string recording_id, std::string transcription) {
    entries_.push_back(Utterance{std::move(recording_id), std::move(transcription)});
}

Result<void> TranscriptLedger::remove(size_t index) {
    if (index >= entries_.size()) {
        return make_error(ErrorKind::Index,
                          std::format("ledger index {} out of range (size {})", index, entries_.size()));
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    return {};
}

Result<void> TranscriptLedger::persist(const std::string& path) const {
    // Written beside the target, then renamed over it.
    auto tmp_path = path + ".tmp";
    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return make_error(ErrorKind::Io, "cannot write ledger " + tmp_path);
        }
        for (const auto& e : entries_) {
            f << e.recording_id << '|' << e.transcription << '\n';
        }
        f.flush();
        if (!f) {
            return make_error(ErrorKind::Io, "write failed for ledger " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(tmp_path, ec);
        return make_error(ErrorKind::Io, std::format("cannot replace ledger {}: {}", path, reason));
    }
    return {};
}

Result<TranscriptLedger::Mapping> TranscriptLedger::load(const std::string& path) {
    Mapping mapping;
    auto res = read_lines(path, [&](std::string id, std::string text) {
        mapping[normalize_id(id)] = std::move(text);
    });
    if (!res) return std::unexpected(res.error());
    return mapping;
}

Result<TranscriptLedger> TranscriptLedger::parse(const std::string& path) {
    TranscriptLedger ledger;
    auto res = read_lines(path, [&](std::string id, std::string text) {
        ledger.append(std::move(id), std::move(text));
    });
    if (!res) return std::unexpected(res.error());
    return ledger;
}

std::string TranscriptLedger::normalize_id(const std::string& recording_id) {
    if (recording_id.empty()) return recording_id;
    auto normal = fs::path(recording_id).lexically_normal().generic_string();
    // "wavs/" normalizes to "wavs/"; drop the trailing separator like a path join would.
    while (normal.size() > 1 && normal.back() == '/') normal.pop_back();
    return normal;
}
