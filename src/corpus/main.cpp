#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println("Usage: {} [options] <command>", prog);
    std::println("Commands:");
    std::println("  list                List recordings and transcriptions");
    std::println("  generate            Print a sentence from the sources");
    std::println("  record              Prompt, record and save sentences interactively");
    std::println("  remove INDEX        Remove a ledger entry (the WAV file is kept)");
    std::println("  trim                Trim leading/trailing silence of every recording");
    std::println("  status              Show dataset and session state as JSON");
    std::println("Options:");
    std::println("  -r, --root DIR      Directory that holds the dataset");
    std::println("  -n, --name NAME     Dataset name");
    std::println("  -s, --source FILE   Sentence source (repeatable)");
    std::println("  -t, --text TEXT     Record this sentence instead of a generated one");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string root;
    std::string name;
    std::string text;
    std::vector<std::string> sources;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 < argc) return argv[++i];
            std::println(stderr, "{} needs a value", arg);
            std::exit(2);
        };

        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            config_path = next();
        } else if (arg == "--root" || arg == "-r") {
            root = next();
        } else if (arg == "--name" || arg == "-n") {
            name = next();
        } else if (arg == "--source" || arg == "-s") {
            sources.push_back(next());
        } else if (arg == "--text" || arg == "-t") {
            text = next();
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }
    const std::string command = positional[0];

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (!root.empty()) config.dataset.root = root;
    if (!name.empty()) config.dataset.name = name;
    config.sources.insert(config.sources.end(), sources.begin(), sources.end());

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize");
        return 1;
    }
    auto& core = loop.core();

    if (command == "record") {
        if (!text.empty()) core.set_prompt(text);
        return loop.run_record();
    }

    if (command == "trim") {
        return loop.run_trim();
    }

    if (command == "generate") {
        auto sentence = core.generate();
        if (!sentence) {
            std::println(stderr, "No sentence sources: add one with --source");
            return 1;
        }
        std::println("{}", *sentence);
        return 0;
    }

    if (command == "status") {
        std::println("{}", core.status().dump(2));
        return 0;
    }

    if (!core.has_dataset()) {
        std::println(stderr, "No dataset: set --root and --name (or dataset.* in the config)");
        return 1;
    }

    if (command == "list") {
        const auto& entries = core.ledger().entries();
        for (size_t i = 0; i < entries.size(); ++i) {
            std::println("{:>4}  {}  {}", i, entries[i].recording_id, entries[i].transcription);
        }
        return 0;
    }

    if (command == "remove") {
        if (positional.size() < 2) {
            std::println(stderr, "remove needs an index");
            return 1;
        }
        char* end = nullptr;
        unsigned long index = std::strtoul(positional[1].c_str(), &end, 10);
        if (end == positional[1].c_str() || *end != '\0' || positional[1][0] == '-') {
            std::println(stderr, "Invalid index: {}", positional[1]);
            return 1;
        }
        if (auto res = core.remove_entry(index); !res) {
            std::println(stderr, "{}: {}", to_string(res.error().kind), res.error().message);
            return 1;
        }
        std::println("Removed entry {} ({} left)", index, core.ledger().size());
        return 0;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
