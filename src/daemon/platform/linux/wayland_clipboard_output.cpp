#include "platform/linux/wayland_clipboard_output.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(std::string_view call) {
    return std::format("{}() failed: {}", call, std::strerror(errno));
}

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // namespace

// Pipes the text into `wl-copy --type text/plain;charset=utf-8`.
std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe2"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork");
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        ::dup2(pipefd[0], STDIN_FILENO);
        ::execlp("wl-copy", "wl-copy", "--type", "text/plain;charset=utf-8", nullptr);
        ::_exit(127);
    }

    ::close(pipefd[0]);
    bool written = write_all(pipefd[1], text);
    auto write_msg = written ? std::string{} : errno_message("write");
    ::close(pipefd[1]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid"));
    }

    if (!written) return std::unexpected(write_msg);

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("wl-copy not found");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(std::format("wl-copy exited with code {}", WEXITSTATUS(status)));
    }
    return {};
}
