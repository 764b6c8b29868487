#include "corpus_core.hpp"

#include <algorithm>
#include <format>
#include <print>

CorpusCore::CorpusCore(Config config, bool verbose, CaptureDevice& device)
    : config_(std::move(config)), verbose_(verbose),
      device_(device),
      session_(device_, config_.dataset.id_style),
      trimmer_(config_.trim) {}

CorpusCore::CorpusCore(Config config, bool verbose, CaptureDevice& device, uint32_t seed)
    : config_(std::move(config)), verbose_(verbose),
      device_(device),
      session_(device_, config_.dataset.id_style),
      generator_(seed),
      trimmer_(config_.trim) {}

bool CorpusCore::init() {
    for (const auto& path : config_.sources) {
        if (auto res = add_source(path); !res) {
            std::println(stderr, "Warning: source {} skipped: {}", path, res.error().message);
        }
    }

    if (!config_.dataset.root.empty() && !config_.dataset.name.empty()) {
        if (auto res = open_dataset(config_.dataset.root, config_.dataset.name); !res) {
            std::println(stderr, "{}: {}", to_string(res.error().kind), res.error().message);
            return false;
        }
    }
    return true;
}

Result<void> CorpusCore::open_dataset(const std::string& root, const std::string& name) {
    if (session_.state() == SessionState::Recording) {
        return make_error(ErrorKind::State, "cannot switch dataset while recording");
    }

    auto boot = DatasetWorkspace::bootstrap(root, name);
    if (!boot) return std::unexpected(boot.error());

    workspace_ = std::move(boot->workspace);
    ledger_ = std::move(boot->ledger);

    if (auto res = ledger_.persist(workspace_->metadata_path()); !res) {
        return res;
    }

    log(std::format("Opened {} ({} recordings)", workspace_->root(), ledger_.size()));
    return {};
}

Result<void> CorpusCore::add_source(const std::string& path) {
    if (generator_.has_source(path)) return {};

    auto corpus = SourceCorpus::from_file(path);
    if (!corpus) return std::unexpected(corpus.error());

    log(std::format("Source {} ({} sentences)", path, corpus->size()));
    generator_.add_source(std::move(*corpus));
    return {};
}

bool CorpusCore::remove_source(const std::string& origin) {
    return generator_.remove_source(origin);
}

std::optional<std::string> CorpusCore::generate() {
    auto sentence = generator_.pick();
    if (sentence) prompt_ = *sentence;
    return sentence;
}

void CorpusCore::set_prompt(std::string text) {
    // A ledger line holds exactly one entry.
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    prompt_ = std::move(text);
}

bool CorpusCore::can_record() const {
    return workspace_.has_value() && !prompt_.empty();
}

Result<void> CorpusCore::start_recording() {
    if (!workspace_) {
        return make_error(ErrorKind::State, "no dataset is open");
    }
    if (prompt_.empty()) {
        return make_error(ErrorKind::State, "no sentence to record");
    }

    auto res = session_.start(DeviceConfig{});
    if (res) log("Recording started");
    return res;
}

Result<void> CorpusCore::poll() {
    return session_.poll_tick();
}

Result<Utterance> CorpusCore::stop_recording() {
    if (session_.state() != SessionState::Recording) {
        return make_error(ErrorKind::State, "not recording");
    }

    auto seq = workspace_->next_sequence_number(ledger_);
    auto utt = session_.stop(*workspace_, seq, prompt_);
    if (!utt) return utt;

    ledger_.append(utt->recording_id, utt->transcription);
    if (auto res = ledger_.persist(workspace_->metadata_path()); !res) {
        std::println(stderr, "Warning: {} recorded but ledger not saved", utt->recording_id);
        return std::unexpected(res.error());
    }

    log(std::format("Saved {} as {}", workspace_->recording_path(seq), utt->recording_id));
    return utt;
}

void CorpusCore::abort_recording() {
    if (session_.state() != SessionState::Recording) return;
    session_.abort();
    log("Recording discarded");
}

Result<void> CorpusCore::remove_entry(size_t index) {
    if (!workspace_) {
        return make_error(ErrorKind::State, "no dataset is open");
    }

    auto res = ledger_.remove(index);
    if (!res) return res;
    return ledger_.persist(workspace_->metadata_path());
}

Result<TrimReport> CorpusCore::trim_silence(std::stop_token stop,
                                            const SilenceTrimmer::ProgressCallback& progress) const {
    if (!workspace_) {
        return make_error(ErrorKind::State, "no dataset is open");
    }
    return trimmer_.run_batch(ledger_, *workspace_, std::move(stop), progress);
}

nlohmann::json CorpusCore::status() const {
    nlohmann::json resp = {
        {"dataset", workspace_ ? workspace_->root() : ""},
        {"recordings", ledger_.size()},
        {"sources", generator_.sources().size()},
        {"prompt", prompt_},
    };
    switch (session_.state()) {
        case SessionState::Idle:
            resp["state"] = "idle";
            break;
        case SessionState::Recording:
            resp["state"] = "recording";
            resp["duration"] = session_.recording_duration();
            break;
    }
    return resp;
}

void CorpusCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        log("Discarding unfinished recording");
        session_.abort();
    }
}

void CorpusCore::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[speech-corpus] {}", msg);
    }
}
