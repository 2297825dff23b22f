#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/glu-code";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/glu-code";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/glu-code";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/glu-code";
}

std::string default_model_dir() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "") + "/.local/share/vosk/model";
}

} // namespace platform
