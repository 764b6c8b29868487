#pragma once

#include "source_corpus.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

// Draws prompt sentences from the registered corpora.
//
// Selection is two-stage: a corpus is chosen uniformly, then a line within it.
// With corpora of unequal size this favours lines of the smaller ones.
class SentenceGenerator {
public:
    SentenceGenerator();
    explicit SentenceGenerator(uint32_t seed);

    // Returns false if a corpus with the same origin is already registered.
    bool add_source(SourceCorpus corpus);
    bool remove_source(const std::string& origin);
    bool has_source(const std::string& origin) const;

    const std::vector<SourceCorpus>& sources() const { return sources_; }
    bool empty() const { return sources_.empty(); }

    // Empty when no corpus is registered.
    std::optional<std::string> pick();

private:
    std::vector<SourceCorpus> sources_;
    std::mt19937 rng_;
};
