#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/glu-code, or ~/.config/glu-code. Empty if no home is known.
std::string config_dir();

// $XDG_DATA_HOME/glu-code, or ~/.local/share/glu-code. Empty if no home is known.
std::string data_dir();

// Where the recognizer helper looks for its model when nothing else is configured.
std::string default_model_dir();

} // namespace platform
