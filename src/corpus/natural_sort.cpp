#include "natural_sort.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Splits into runs that always start and end with a (possibly empty) text run:
// text, digits, text, digits, ..., text.
std::vector<std::string_view> split_runs(std::string_view s) {
    std::vector<std::string_view> runs;
    size_t pos = 0;
    bool want_digits = false;
    while (true) {
        size_t end = pos;
        while (end < s.size() && is_digit(s[end]) == want_digits) end++;
        runs.push_back(s.substr(pos, end - pos));
        if (end == s.size()) break;
        pos = end;
        want_digits = !want_digits;
    }
    if (runs.size() % 2 == 0) runs.push_back({});
    return runs;
}

// Three-way comparison of two digit runs by integer value.
int compare_numbers(std::string_view a, std::string_view b) {
    auto strip = [](std::string_view v) {
        auto nz = v.find_first_not_of('0');
        return nz == std::string_view::npos ? std::string_view{} : v.substr(nz);
    };
    a = strip(a);
    b = strip(b);
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    return a.compare(b);
}

} // namespace

namespace natural {

bool less(std::string_view a, std::string_view b) {
    auto ra = split_runs(a);
    auto rb = split_runs(b);

    size_t n = std::min(ra.size(), rb.size());
    for (size_t i = 0; i < n; ++i) {
        int cmp = (i % 2 == 1) ? compare_numbers(ra[i], rb[i]) : ra[i].compare(rb[i]);
        if (cmp != 0) return cmp < 0;
    }
    return ra.size() < rb.size();
}

void sort(std::vector<std::string>& items) {
    std::sort(items.begin(), items.end(), [](const std::string& a, const std::string& b) {
        if (less(a, b)) return true;
        if (less(b, a)) return false;
        return a < b;
    });
}

} // namespace natural
