#pragma once

#include "dataset_workspace.hpp"
#include "silence_trimmer.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Dataset {
        std::string root;
        std::string name;
        RecordingIdStyle id_style = RecordingIdStyle::LjSpeech;
    } dataset;

    // Corpus text files registered with the sentence generator.
    std::vector<std::string> sources;

    struct Audio {
        uint32_t poll_interval_ms = 1;
        uint32_t buffer_seconds = 4;
    } audio;

    TrimOptions trim;

    static Config load(const std::string& path);
    static Config load_default();
};
