#pragma once

#include <string>
#include <string_view>
#include <vector>

// Human ordering: "utt2.wav" sorts before "utt10.wav".
//
// Each string is split into alternating runs of digits and non-digits. Digit
// runs compare by integer value, other runs as plain strings, and the run
// sequences compare lexicographically.
namespace natural {

bool less(std::string_view a, std::string_view b);

void sort(std::vector<std::string>& items);

} // namespace natural
