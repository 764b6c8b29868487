#include "sentence_generator.hpp"

#include <algorithm>

SentenceGenerator::SentenceGenerator() : rng_(std::random_device{}()) {}

SentenceGenerator::SentenceGenerator(uint32_t seed) : rng_(seed) {}

bool SentenceGenerator::add_source(SourceCorpus corpus) {
    if (has_source(corpus.origin())) return false;
    sources_.push_back(std::move(corpus));
    return true;
}

bool SentenceGenerator::remove_source(const std::string& origin) {
    return std::erase_if(sources_, [&](const SourceCorpus& c) { return c.origin() == origin; }) > 0;
}

bool SentenceGenerator::has_source(const std::string& origin) const {
    return std::any_of(sources_.begin(), sources_.end(),
                       [&](const SourceCorpus& c) { return c.origin() == origin; });
}

std::optional<std::string> SentenceGenerator::pick() {
    if (sources_.empty()) return std::nullopt;

    std::uniform_int_distribution<size_t> pick_source(0, sources_.size() - 1);
    const auto& corpus = sources_[pick_source(rng_)];

    std::uniform_int_distribution<size_t> pick_line(0, corpus.size() - 1);
    return corpus.lines()[pick_line(rng_)];
}
