#include "source_corpus.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool is_continuation(uint8_t c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

namespace utf8 {

std::string sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const size_t remaining = text.size() - i;
        const auto c = static_cast<uint8_t>(text[i]);

        size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
        }

        bool valid = len > 0 && remaining >= len;
        for (size_t k = 1; valid && k < len; ++k) {
            valid = is_continuation(static_cast<uint8_t>(text[i + k]));
        }

        if (valid && len >= 3) {
            // Reject overlong forms, surrogates and code points past U+10FFFF.
            auto c1 = static_cast<uint8_t>(text[i + 1]);
            if (c == 0xE0 && c1 < 0xA0) valid = false;
            if (c == 0xED && c1 > 0x9F) valid = false;
            if (c == 0xF0 && c1 < 0x90) valid = false;
            if (c == 0xF4 && c1 > 0x8F) valid = false;
        }

        if (valid) {
            out.append(text.substr(i, len));
            i += len;
        } else {
            i++;
        }
    }
    return out;
}

} // namespace utf8

Result<SourceCorpus> SourceCorpus::from_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return make_error(ErrorKind::Io, "cannot open corpus " + path);
    }

    std::string raw{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) {
        return make_error(ErrorKind::Io, "read failed for corpus " + path);
    }
    return from_text(path, raw);
}

Result<SourceCorpus> SourceCorpus::from_text(std::string origin, std::string_view text) {
    auto clean = utf8::sanitize(text);

    std::vector<std::string> lines;
    std::istringstream in(clean);
    std::string line;
    while (std::getline(in, line)) {
        auto content = trim(line);
        if (!content.empty()) lines.emplace_back(content);
    }

    if (lines.empty()) {
        return make_error(ErrorKind::EmptyCorpus, "corpus " + origin + " has no sentences");
    }
    return SourceCorpus(std::move(origin), std::move(lines));
}
