#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/voxpaste or ~/.config/voxpaste
std::string config_dir();

// $XDG_DATA_HOME/voxpaste or ~/.local/share/voxpaste
std::string data_dir();

// Path of the daemon's control socket.
std::string ipc_endpoint();

} // namespace platform
