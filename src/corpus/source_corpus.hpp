#pragma once

#include "error.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Immutable list of candidate sentences read from one text file.
class SourceCorpus {
public:
    // Reads `path`, one sentence per line. Invalid UTF-8 is dropped and
    // whitespace-only lines are skipped. Fails with EmptyCorpus when no line
    // survives.
    static Result<SourceCorpus> from_file(const std::string& path);

    // Builds a corpus from text already in memory; `origin` names it.
    static Result<SourceCorpus> from_text(std::string origin, std::string_view text);

    const std::string& origin() const { return origin_; }
    const std::vector<std::string>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }

private:
    SourceCorpus(std::string origin, std::vector<std::string> lines)
        : origin_(std::move(origin)), lines_(std::move(lines)) {}

    std::string origin_;
    std::vector<std::string> lines_;
};

namespace utf8 {

// Copies `text`, dropping every byte that does not belong to a well-formed
// UTF-8 sequence.
std::string sanitize(std::string_view text);

} // namespace utf8
