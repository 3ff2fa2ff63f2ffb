#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

bool daemonize(std::string& error) {
    pid_t pid = fork();
    if (pid < 0) {
        error = std::format("fork() failed: {}", std::strerror(errno));
        return false;
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        error = std::format("setsid() failed: {}", std::strerror(errno));
        return false;
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    umask(077);
    if (chdir("/") < 0) {
        error = std::format("chdir(/) failed: {}", std::strerror(errno));
        return false;
    }

    if (!freopen("/dev/null", "r", stdin) || !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        error = "cannot redirect stdio to /dev/null";
        return false;
    }
    return true;
}

} // namespace platform
