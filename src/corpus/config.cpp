#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("dataset")) {
            auto& d = j["dataset"];
            if (d.contains("root")) cfg.dataset.root = d["root"].get<std::string>();
            if (d.contains("name")) cfg.dataset.name = d["name"].get<std::string>();
            if (d.contains("id_style")) {
                auto style = d["id_style"].get<std::string>();
                if (style == "ljspeech") {
                    cfg.dataset.id_style = RecordingIdStyle::LjSpeech;
                } else if (style == "wavs_path") {
                    cfg.dataset.id_style = RecordingIdStyle::WavsPath;
                } else {
                    std::println(stderr, "config: unknown id_style '{}', using ljspeech", style);
                }
            }
        }

        if (j.contains("sources")) {
            cfg.sources = j["sources"].get<std::vector<std::string>>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("poll_interval_ms")) cfg.audio.poll_interval_ms = a["poll_interval_ms"].get<uint32_t>();
            if (a.contains("buffer_seconds")) cfg.audio.buffer_seconds = a["buffer_seconds"].get<uint32_t>();
        }

        if (j.contains("trim")) {
            auto& t = j["trim"];
            if (t.contains("threshold_dbfs")) cfg.trim.threshold_dbfs = t["threshold_dbfs"].get<double>();
            if (t.contains("chunk_ms")) cfg.trim.chunk_ms = t["chunk_ms"].get<size_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.trim.chunk_ms == 0) {
        std::println(stderr, "config: trim.chunk_ms must be positive, using 10");
        cfg.trim.chunk_ms = 10;
    }
    if (cfg.audio.poll_interval_ms == 0) cfg.audio.poll_interval_ms = 1;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
