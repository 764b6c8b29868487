#pragma once

#include "error.hpp"

#include <string>
#include <unordered_map>
#include <vector>

struct Utterance {
    std::string recording_id;
    std::string transcription;

    bool operator==(const Utterance&) const = default;
};

// Ordered recording-id -> transcription pairs, persisted as metadata.csv.
//
// Each persisted line is "{recording_id}|{transcription}\n" with no header.
// Mutation and persistence are separate calls: nothing reaches disk until
// persist() runs, and persist() rewrites the whole file. The ledger assumes a
// single writer. Ids must be unique and must not contain '|'; neither is
// checked here.
class TranscriptLedger {
public:
    using Mapping = std::unordered_map<std::string, std::string>;

    void append(std::string recording_id, std::string transcription);
    Result<void> remove(size_t index);

    const std::vector<Utterance>& entries() const { return entries_; }
    const Utterance& at(size_t index) const { return entries_.at(index); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    Result<void> persist(const std::string& path) const;

    // Reads `path` into an id -> transcription map. Ids are normalized as
    // lexical paths. Blank lines are skipped; a line without '|' is a Parse
    // error naming the line.
    static Result<Mapping> load(const std::string& path);

    // Same parsing as load(), keeping file order.
    static Result<TranscriptLedger> parse(const std::string& path);

    // Lexically normal, '/'-separated form used as the lookup key.
    static std::string normalize_id(const std::string& recording_id);

private:
    std::vector<Utterance> entries_;
};
