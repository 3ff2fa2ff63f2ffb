#pragma once

#include <string>

namespace platform {

// Detach from the controlling terminal. In the surviving grandchild this
// returns true; the intermediate processes exit. False means the first fork
// or setsid failed and the caller is still attached.
bool daemonize(std::string& error);

} // namespace platform
