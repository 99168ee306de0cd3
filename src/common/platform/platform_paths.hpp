#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/asr-stream or ~/.config/asr-stream. Empty if neither is set.
std::string config_dir();

} // namespace platform
