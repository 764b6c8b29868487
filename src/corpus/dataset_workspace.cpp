#include "dataset_workspace.hpp"

#include "natural_sort.hpp"

#include <cctype>
#include <filesystem>
#include <format>
#include <print>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* wavs_name = "wavs";
constexpr const char* metadata_name = "metadata.csv";
constexpr const char* wav_extension = ".wav";

} // namespace

Result<DatasetWorkspace::Bootstrap> DatasetWorkspace::bootstrap(const std::string& root_path,
                                                                const std::string& dataset_name) {
    if (root_path.empty() || dataset_name.empty()) {
        return make_error(ErrorKind::Workspace, "dataset root and name must both be set");
    }
    // The name prefixes every recording id and file name.
    if (dataset_name.find_first_of("|/") != std::string::npos) {
        return make_error(ErrorKind::Workspace,
                          std::format("dataset name '{}' must not contain '|' or '/'", dataset_name));
    }
    if (std::isspace(static_cast<unsigned char>(dataset_name.front())) ||
        std::isspace(static_cast<unsigned char>(dataset_name.back()))) {
        return make_error(ErrorKind::Workspace,
                          std::format("dataset name '{}' has surrounding whitespace", dataset_name));
    }

    auto full = fs::path(root_path) / dataset_name;
    std::error_code ec;
    fs::create_directories(full, ec);
    if (ec) {
        return make_error(ErrorKind::Workspace,
                          std::format("cannot create {}: {}", full.string(), ec.message()));
    }
    if (!fs::is_directory(full, ec)) {
        return make_error(ErrorKind::Workspace, full.string() + " is not a directory");
    }

    Bootstrap result{DatasetWorkspace(full.string(), dataset_name), {}};
    const auto& ws = result.workspace;

    auto metadata = fs::path(ws.metadata_path());
    if (!fs::is_directory(ws.wavs_dir(), ec) || !fs::is_regular_file(metadata, ec)) {
        return result;
    }

    auto mapping = TranscriptLedger::load(metadata.string());
    if (!mapping) return std::unexpected(mapping.error());

    auto files = ws.list_recordings();
    if (!files) return std::unexpected(files.error());

    size_t skipped = 0;
    for (const auto& file : *files) {
        auto path_id = ws.recording_id(file, RecordingIdStyle::WavsPath);
        auto stripped_id = ws.recording_id(file, RecordingIdStyle::LjSpeech);

        if (auto it = mapping->find(path_id); it != mapping->end()) {
            result.ledger.append(path_id, it->second);
        } else if (auto it2 = mapping->find(stripped_id); it2 != mapping->end()) {
            result.ledger.append(stripped_id, it2->second);
        } else {
            skipped++;
        }
    }

    if (skipped > 0) {
        std::println(stderr, "workspace: {} recording(s) in {} have no transcription, skipped",
                     skipped, ws.wavs_dir());
    }
    return result;
}

std::string DatasetWorkspace::wavs_dir() const {
    return (fs::path(root_) / wavs_name).string();
}

std::string DatasetWorkspace::metadata_path() const {
    return (fs::path(root_) / metadata_name).string();
}

std::string DatasetWorkspace::recording_path(uint32_t sequence) const {
    return (fs::path(wavs_dir()) / std::format("{}{}{}", name_, sequence, wav_extension)).string();
}

std::string DatasetWorkspace::recording_id(const std::string& file, RecordingIdStyle style) const {
    fs::path p(file);
    if (p.is_relative() && !p.has_parent_path()) {
        p = fs::path(wavs_name) / p;
    } else if (p.is_absolute()) {
        p = p.lexically_relative(root_);
    }
    auto id = p.lexically_normal().generic_string();

    if (style == RecordingIdStyle::LjSpeech) {
        auto prefix = std::string(wavs_name) + "/";
        if (id.starts_with(prefix)) id.erase(0, prefix.size());
        if (id.ends_with(wav_extension)) id.erase(id.size() - std::string_view(wav_extension).size());
    }
    return id;
}

std::string DatasetWorkspace::audio_path(const std::string& recording_id) const {
    fs::path id(recording_id);
    if (id.extension() == wav_extension) {
        return (fs::path(root_) / id).string();
    }
    return (fs::path(wavs_dir()) / (recording_id + wav_extension)).string();
}

uint32_t DatasetWorkspace::next_sequence_number(const TranscriptLedger& ledger) const {
    auto seq = static_cast<uint32_t>(ledger.size() + 1);
    std::error_code ec;
    while (fs::exists(recording_path(seq), ec)) seq++;
    return seq;
}

Result<std::vector<std::string>> DatasetWorkspace::list_recordings() const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(wavs_dir(), ec);
    if (ec) {
        return make_error(ErrorKind::Io, std::format("cannot list {}: {}", wavs_dir(), ec.message()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        if (name.starts_with(".") || entry.path().extension() != wav_extension) continue;
        if (!entry.is_regular_file(ec)) continue;
        names.push_back(std::move(name));
    }
    if (ec) {
        return make_error(ErrorKind::Io, std::format("cannot list {}: {}", wavs_dir(), ec.message()));
    }

    natural::sort(names);
    return names;
}
