#pragma once

#include "audio/capture_buffer.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "events.hpp"
#include "gpu_whisper/gpu_whisper_provider.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "providers/provider_registry.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void handle_request(int fd, const nlohmann::json& cmd);
    void flush_events();
    void drop_client(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    CaptureBuffer capture_buffer_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;
    EventBus events_;
    ProviderRegistry providers_;
    std::shared_ptr<GpuWhisperProvider> gpu_;

    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int bus_event_fd_ = -1;

    // Events published from any thread, delivered to subscribers on this one.
    std::mutex pending_mu_;
    std::vector<nlohmann::json> pending_events_;
    std::vector<int> subscribers_;
    int bus_subscription_ = 0;

    std::atomic<bool> running_{false};
};
