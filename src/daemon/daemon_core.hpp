#pragma once

#include "audio/capture_buffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "events.hpp"
#include "gpu_whisper/gpu_whisper_provider.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "providers/provider_registry.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class DaemonCore {
public:
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>()>;
    using NotifyCallback = std::function<void()>;

    struct Deps {
        CaptureBuffer& capture_buffer;
        AudioCapture& audio;
        IpcServer& ipc;
        ProviderRegistry& providers;
        std::shared_ptr<GpuWhisperProvider> gpu; // may be null
        EventBus& events;
    };

    DaemonCore(Config config, std::string config_path, bool verbose, Deps deps,
               OutputFactory output_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Empty history_path selects <data_dir>/history.db.
    bool init(const std::string& history_path = {});

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Called on the event-loop thread after the worker signalled completion.
    void on_transcription_complete();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    SessionState session_state() const { return session_.state(); }
    const Config& config() const { return config_; }

    void shutdown();

    static nlohmann::json error_response(const Error& err);

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_devices(const nlohmann::json& cmd);
    nlohmann::json handle_providers(const nlohmann::json& cmd);
    nlohmann::json handle_set_provider(const nlohmann::json& cmd);
    nlohmann::json handle_get_settings(const nlohmann::json& cmd);
    nlohmann::json handle_save_settings(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_clear_history(const nlohmann::json& cmd);
    nlohmann::json handle_transcribe_file(const nlohmann::json& cmd);
    nlohmann::json handle_gpu_status(const nlohmann::json& cmd);
    nlohmann::json handle_download_model(const nlohmann::json& cmd);

    // Resolves the backend, snapshots its config and hands everything to the worker.
    nlohmann::json begin_transcription(std::vector<float> audio,
                                       std::optional<ProviderId> provider_override);

    struct Job {
        std::shared_ptr<SttProvider> provider;
        ProviderConfig config;
        std::vector<float> audio;
    };
    void start_transcription(Job job);

    // Report a failure, emit an error event and return the session to Idle.
    nlohmann::json fail(const Error& err);

    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    CaptureBuffer& capture_buffer_;
    AudioCapture& audio_;
    IpcServer& ipc_;
    ProviderRegistry& providers_;
    std::shared_ptr<GpuWhisperProvider> gpu_;
    EventBus& events_;

    OutputFactory output_factory_;
    NotifyCallback notify_;

    Session session_;
    HistoryDb history_db_;

    std::vector<int> waiting_clients_;

    struct WorkerResult {
        std::expected<TranscriptionResult, Error> result = std::unexpected(Error{});
        double audio_duration_s = 0.0;
    };
    WorkerResult worker_result_;
    std::jthread worker_;

    std::atomic<bool> downloading_{false};
    std::jthread downloader_;
};
