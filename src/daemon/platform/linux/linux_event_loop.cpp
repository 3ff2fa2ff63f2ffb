#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/platform_paths.hpp"
#include "providers/google_provider.hpp"
#include "providers/lan_provider.hpp"
#include "providers/openai_provider.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

void signal_eventfd(int fd) {
    uint64_t val = 1;
    if (::write(fd, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void drain_eventfd(int fd) {
    uint64_t val;
    while (::read(fd, &val, sizeof(val)) > 0) {}
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      audio_capture_(capture_buffer_),
      gpu_(std::make_shared<GpuWhisperProvider>(
          gpu_whisper::ModelStore(gpu_whisper::ModelStore::default_dir(),
                                  config_.gpu_whisper.download_url),
          gpu_loader_settings(config_))),
      core_(config_, std::move(config_path), verbose_,
            DaemonCore::Deps{
                .capture_buffer = capture_buffer_,
                .audio = audio_capture_,
                .ipc = ipc_server_,
                .providers = providers_,
                .gpu = gpu_,
                .events = events_,
            },
            // OutputFactory
            []() -> std::unique_ptr<OutputMethod> {
                return std::make_unique<WaylandClipboardOutput>();
            },
            // NotifyCallback
            [this]() { signal_eventfd(worker_event_fd_); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (bus_subscription_) events_.unsubscribe(bus_subscription_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (bus_event_fd_ >= 0) ::close(bus_event_fd_);
}

bool LinuxEventLoop::init() {
    providers_.add(std::make_shared<OpenAiProvider>());
    providers_.add(std::make_shared<GoogleProvider>());
    providers_.add(std::make_shared<LanProvider>());
    providers_.add(gpu_);

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (active backend, history db)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    bus_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0 || bus_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    bus_subscription_ = events_.subscribe([this](const Event& ev) {
        {
            std::lock_guard lock(pending_mu_);
            pending_events_.push_back(ev.to_json());
        }
        signal_eventfd(bus_event_fd_);
    });

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) || !add_fd(bus_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                drain_eventfd(worker_event_fd_);
                core_.on_transcription_complete();
                continue;
            }

            if (fd == bus_event_fd_) {
                drain_eventfd(bus_event_fd_);
                flush_events();
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    flush_events();
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    auto status = ipc_server_.read_command(fd, cmd);
    while (status == ReadStatus::Command || status == ReadStatus::Invalid) {
        if (status == ReadStatus::Invalid) {
            ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid request"}});
        } else {
            handle_request(fd, cmd);
        }
        status = ipc_server_.next_command(fd, cmd);
    }

    if (status == ReadStatus::Closed) {
        drop_client(fd);
    }
}

void LinuxEventLoop::handle_request(int fd, const nlohmann::json& cmd) {
    if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
        ipc_server_.send_response(fd, {{"status", "error"}, {"message", "missing 'cmd'"}});
        return;
    }

    auto cmd_str = cmd["cmd"].get<std::string>();
    nlohmann::json response;
    try {
        response = core_.handle_command(cmd_str, cmd);
    } catch (const nlohmann::json::exception& e) {
        response = {{"status", "error"}, {"message", std::string("bad arguments: ") + e.what()}};
    }

    auto status = response.value("status", "");
    if (status == "transcribing") {
        // Answered when the worker finishes
        core_.add_waiting_client(fd);
    } else if (status == "subscribed") {
        subscribers_.push_back(fd);
        ipc_server_.send_response(fd, {{"status", "ok"}, {"message", "subscribed"}});
    } else {
        ipc_server_.send_response(fd, response);
    }
}

void LinuxEventLoop::flush_events() {
    std::vector<nlohmann::json> batch;
    {
        std::lock_guard lock(pending_mu_);
        batch.swap(pending_events_);
    }

    for (auto& ev : batch) {
        std::vector<int> dead;
        for (int fd : subscribers_) {
            if (!ipc_server_.send_response(fd, ev)) dead.push_back(fd);
        }
        for (int fd : dead) drop_client(fd);
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_waiting_client(fd);
    std::erase(subscribers_, fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxpaste] {}", msg);
    }
}
