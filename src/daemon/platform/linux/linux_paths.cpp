#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/voxpaste";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/voxpaste";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/voxpaste";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/voxpaste";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/voxpaste.sock";
    return "/tmp/voxpaste.sock";
}

} // namespace platform
