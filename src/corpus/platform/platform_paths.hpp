#pragma once

#include <string>

namespace platform {

// Per-user configuration directory for speech-corpus; empty if unknown.
std::string config_dir();

} // namespace platform
