#include "daemon_core.hpp"

#include "audio/resampler.hpp"
#include "audio/wav.hpp"
#include "platform/platform_paths.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <print>

using json = nlohmann::json;

namespace {

json result_to_json(const TranscriptionResult& tr) {
    json j = {
        {"text", tr.text},
        {"provider", std::string(to_string(tr.provider))},
        {"duration_ms", tr.duration_ms},
        {"audio_duration", tr.audio_duration_s},
    };
    j["language"] = tr.language ? json(*tr.language) : json(nullptr);
    return j;
}

std::expected<ProviderId, Error> parse_provider(const json& cmd) {
    std::string name = cmd.value("provider", "");
    if (name.empty()) {
        return std::unexpected(config_error("missing 'provider'"));
    }
    auto id = provider_id_from_string(name);
    if (!id) {
        return std::unexpected(config_error("unknown provider: " + name));
    }
    return *id;
}

} // namespace

DaemonCore::DaemonCore(Config config, std::string config_path, bool verbose, Deps deps,
                       OutputFactory output_factory, NotifyCallback notify)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      capture_buffer_(deps.capture_buffer), audio_(deps.audio), ipc_(deps.ipc),
      providers_(deps.providers), gpu_(std::move(deps.gpu)), events_(deps.events),
      output_factory_(std::move(output_factory)),
      notify_(std::move(notify)),
      session_(capture_buffer_, audio_) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    providers_.set_active(config_.active_provider);
    providers_.configure_all(config_);

    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/voxpaste/history.db";
    }
    history_db_.set_max_entries(config_.history.max_entries);
    if (!history_db_.open(db_path)) {
        std::println(stderr, "db: history DB failed to open, history disabled");
    }

    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "devices") return handle_devices(cmd);
    if (cmd_str == "providers") return handle_providers(cmd);
    if (cmd_str == "set_provider") return handle_set_provider(cmd);
    if (cmd_str == "get_settings") return handle_get_settings(cmd);
    if (cmd_str == "save_settings") return handle_save_settings(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "clear_history") return handle_clear_history(cmd);
    if (cmd_str == "transcribe_file") return handle_transcribe_file(cmd);
    if (cmd_str == "gpu_status") return handle_gpu_status(cmd);
    if (cmd_str == "download_model") return handle_download_model(cmd);
    if (cmd_str == "subscribe") return {{"status", "subscribed"}};
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::error_response(const Error& err) {
    return {
        {"status", "error"},
        {"message", describe(err)},
        {"kind", std::string(to_string(err.kind))},
    };
}

json DaemonCore::fail(const Error& err) {
    session_.set_idle();
    log(describe(err));
    events_.publish(EventType::Error, {
        {"message", describe(err)},
        {"kind", std::string(to_string(err.kind))},
    });
    return error_response(err);
}

json DaemonCore::handle_start(const json& cmd) {
    if (session_.state() != SessionState::Idle) {
        return {{"status", "error"}, {"message", "already recording or transcribing"}};
    }

    std::string device = cmd.value("device", config_.input_device);
    if (auto r = session_.start_recording(device); !r) {
        return fail(r.error());
    }

    log("Recording started" + (device.empty() ? "" : " (" + device + ")"));
    events_.publish(EventType::RecordingStarted, {{"device", device}});
    return {{"status", "ok"}, {"message", "recording"}};
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    if (session_.state() != SessionState::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    auto raw = session_.stop_recording();
    double captured_s = raw.sample_rate && raw.channels
        ? static_cast<double>(raw.samples.size()) / raw.channels / raw.sample_rate
        : 0.0;
    events_.publish(EventType::RecordingStopped, {{"duration", captured_s}});

    auto audio = resample_to_16k_mono(raw.samples, raw.sample_rate, raw.channels);
    if (audio.empty()) {
        return fail(transcribe_error("no audio captured"));
    }

    log(std::format("Recording stopped, {:.1f}s audio ({} Hz, {} ch)",
                    captured_s, raw.sample_rate, raw.channels));
    return begin_transcription(std::move(audio), std::nullopt);
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (session_.state() == SessionState::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {
        {"status", "ok"},
        {"state", std::string(to_string(session_.state()))},
        {"provider", std::string(to_string(providers_.active_id()))},
    };
    if (session_.state() == SessionState::Recording) {
        resp["duration"] = session_.recording_duration();
    }
    return resp;
}

json DaemonCore::handle_devices(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"devices", json::array()}};
    for (auto& d : audio_.list_devices()) {
        resp["devices"].push_back({
            {"name", d.name},
            {"description", d.description},
            {"is_default", d.is_default},
        });
    }
    return resp;
}

json DaemonCore::handle_providers(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"providers", json::array()}};
    for (auto& p : providers_.list()) {
        resp["providers"].push_back({
            {"id", std::string(to_string(p.id))},
            {"name", p.name},
            {"available", p.available},
            {"active", p.active},
        });
    }
    return resp;
}

json DaemonCore::handle_set_provider(const json& cmd) {
    auto id = parse_provider(cmd);
    if (!id) return error_response(id.error());
    if (!providers_.find(*id)) {
        return error_response(config_error(std::format("provider {} is not registered", to_string(*id))));
    }

    // A transcription already running keeps the backend it resolved.
    providers_.set_active(*id);
    config_.active_provider = *id;
    log(std::format("Active provider: {}", to_string(*id)));
    return {{"status", "ok"}, {"provider", std::string(to_string(*id))}};
}

json DaemonCore::handle_get_settings(const json& /*cmd*/) {
    return {{"status", "ok"}, {"settings", config_.to_json()}};
}

json DaemonCore::handle_save_settings(const json& cmd) {
    if (!cmd.contains("settings") || !cmd["settings"].is_object()) {
        return error_response(config_error("missing 'settings' object"));
    }

    Config updated;
    try {
        json merged = config_.to_json();
        merged.merge_patch(cmd["settings"]);
        updated = Config::from_json(merged);
    } catch (const json::exception& e) {
        return error_response(config_error(std::string("invalid settings: ") + e.what()));
    }

    config_ = std::move(updated);
    providers_.set_active(config_.active_provider);
    providers_.configure_all(config_);
    history_db_.set_max_entries(config_.history.max_entries);

    bool persisted = !config_path_.empty() && config_.save(config_path_);
    if (!persisted) {
        std::println(stderr, "config: settings applied but not written to disk");
    }
    return {{"status", "ok"}, {"persisted", persisted}, {"settings", config_.to_json()}};
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"provider", e.provider},
            {"duration_ms", e.duration_ms},
            {"language", e.language},
            {"audio_duration", e.audio_duration},
        });
    }
    return resp;
}

json DaemonCore::handle_clear_history(const json& /*cmd*/) {
    if (!history_db_.clear()) {
        return {{"status", "error"}, {"message", "failed to clear history"}};
    }
    return {{"status", "ok"}};
}

json DaemonCore::handle_transcribe_file(const json& cmd) {
    if (session_.state() != SessionState::Idle) {
        return {{"status", "error"}, {"message", "already recording or transcribing"}};
    }

    std::string path = cmd.value("path", "");
    if (path.empty()) {
        return error_response(transcribe_error("missing 'path'"));
    }

    std::optional<ProviderId> override_id;
    if (cmd.contains("provider")) {
        auto id = parse_provider(cmd);
        if (!id) return error_response(id.error());
        override_id = *id;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return fail(transcribe_error("cannot open " + path));
    }
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};

    auto decoded = wav::decode(bytes);
    if (!decoded) return fail(decoded.error());

    auto audio = resample_to_16k_mono(decoded->samples, decoded->sample_rate, decoded->channels);
    if (audio.empty()) {
        return fail(transcribe_error(path + " contains no audio"));
    }

    log(std::format("Transcribing file {} ({} Hz, {} ch)", path,
                    decoded->sample_rate, decoded->channels));
    return begin_transcription(std::move(audio), override_id);
}

json DaemonCore::handle_gpu_status(const json& /*cmd*/) {
    if (!gpu_) {
        return {{"status", "error"}, {"message", "GPU backend not registered"}};
    }

    auto st = gpu_->store().status();
    json resp = {
        {"status", "ok"},
        {"directory", st.directory},
        {"library_path", gpu_->resolved_library_path().string()},
        {"library_present", st.library_present},
        {"model_path", gpu_->resolved_model_path().string()},
        {"available", gpu_->is_available()},
        {"loaded", gpu_->is_loaded()},
        {"downloading", downloading_.load()},
        {"models", json::array()},
    };
    for (auto& m : st.models) {
        resp["models"].push_back({
            {"name", std::string(m.info.name)},
            {"filename", std::string(m.info.filename)},
            {"size", std::string(m.info.size_description)},
            {"present", m.present},
        });
    }
    return resp;
}

json DaemonCore::handle_download_model(const json& cmd) {
    if (!gpu_) {
        return {{"status", "error"}, {"message", "GPU backend not registered"}};
    }

    std::string model = cmd.value("model", std::string(gpu_whisper::kDefaultModelFilename));
    if (!gpu_whisper::find_model(model)) {
        return error_response(config_error("unknown model: " + model));
    }
    if (downloading_.exchange(true)) {
        return {{"status", "error"}, {"message", "a download is already in progress"}};
    }

    if (downloader_.joinable()) downloader_.join();

    downloader_ = std::jthread([this, model, store = gpu_->store()](std::stop_token stop) {
        auto on_progress = [this](const gpu_whisper::DownloadProgress& p) {
            events_.publish(EventType::DownloadProgress, {
                {"item", p.item},
                {"downloaded_bytes", p.downloaded_bytes},
                {"total_bytes", p.total_bytes},
                {"done", p.done},
            });
        };

        auto result = store.download_model(model, on_progress, stop);
        if (result) {
            events_.publish(EventType::DownloadComplete, {
                {"model", model}, {"path", result->string()}, {"ok", true},
            });
        } else {
            std::println(stderr, "gpu-whisper: {}", describe(result.error()));
            events_.publish(EventType::DownloadComplete, {
                {"model", model}, {"ok", false}, {"error", describe(result.error())},
            });
        }
        downloading_.store(false);
    });

    log("Downloading model " + model);
    return {{"status", "ok"}, {"message", "downloading"}, {"model", model}};
}

json DaemonCore::begin_transcription(std::vector<float> audio,
                                     std::optional<ProviderId> provider_override) {
    auto provider = provider_override ? providers_.find(*provider_override)
                                      : providers_.get_active();
    if (!provider) {
        return fail(config_error("no transcription backend available"));
    }

    auto config = config_.provider_config(provider->id());
    double duration = static_cast<double>(audio.size()) / kCanonicalSampleRate;

    session_.set_transcribing();
    events_.publish(EventType::Transcribing, {
        {"provider", std::string(to_string(provider->id()))},
        {"audio_duration", duration},
    });

    worker_result_ = {};
    worker_result_.audio_duration_s = duration;
    start_transcription(Job{
        .provider = std::move(provider),
        .config = std::move(config),
        .audio = std::move(audio),
    });

    return {{"status", "transcribing"}, {"duration", duration}};
}

void DaemonCore::start_transcription(Job job) {
    // Only the resolved backend, a config snapshot and the audio cross into
    // the worker; nothing it touches is guarded by a lock held here.
    worker_ = std::jthread([this, job = std::move(job)](std::stop_token) mutable {
        worker_result_.result = job.provider->transcribe(job.audio, job.config);
        notify_();
    });
}

void DaemonCore::on_transcription_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (session_.state() != SessionState::Transcribing) return;

    auto& wr = worker_result_;
    json response;

    if (wr.result.has_value()) {
        auto& tr = wr.result.value();
        tr.audio_duration_s = wr.audio_duration_s;
        log(std::format("Transcription complete via {}: {} ms, {} chars",
                        to_string(tr.provider), tr.duration_ms, tr.text.size()));

        if (config_.output.auto_paste && !tr.text.empty() && output_factory_) {
            if (auto output = output_factory_()) {
                if (auto res = output->deliver(tr.text); !res) {
                    log(std::format("Output via {} failed: {}", output->name(), res.error()));
                }
            }
        }

        history_db_.insert(tr);

        auto payload = result_to_json(tr);
        events_.publish(EventType::TranscriptionComplete, payload);
        response = std::move(payload);
        response["status"] = "ok";
        session_.set_idle();
    } else {
        response = fail(wr.result.error());
    }

    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        audio_.stop();
        session_.set_idle();
    }

    if (session_.state() == SessionState::Transcribing) {
        log("Waiting for pending transcription to complete...");
        on_transcription_complete();
    } else if (worker_.joinable()) {
        worker_.join();
    }

    if (downloader_.joinable()) {
        downloader_.request_stop();
        downloader_.join();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxpaste] {}", msg);
    }
}
