#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

namespace {

// Transcription may include a first-time GPU model load.
constexpr int kTranscribeTimeoutMs = 10 * 60 * 1000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--device NAME]               Start recording");
    std::println(stderr, "  stop                                Stop recording and transcribe");
    std::println(stderr, "  toggle [--device NAME]              Toggle recording");
    std::println(stderr, "  status                              Show daemon status");
    std::println(stderr, "  devices                             List input devices");
    std::println(stderr, "  providers                           List transcription backends");
    std::println(stderr, "  set_provider --provider ID          Select the active backend");
    std::println(stderr, "  get_settings                        Print current settings");
    std::println(stderr, "  save_settings --settings JSON       Merge, apply and persist settings");
    std::println(stderr, "  history [--limit N]                 Show transcription history");
    std::println(stderr, "  clear_history                       Delete all history");
    std::println(stderr, "  transcribe_file --file PATH [--provider ID]");
    std::println(stderr, "                                      Transcribe a WAV file");
    std::println(stderr, "  gpu_status                          Show GPU backend files");
    std::println(stderr, "  download_model [--model FILE]       Download a GPU model");
    std::println(stderr, "  listen                              Print lifecycle events");
}

void print_event(const json& ev) {
    auto name = ev.value("event", "");
    auto& payload = ev.contains("payload") ? ev["payload"] : ev;

    if (name == "transcription-complete") {
        std::println("{}: {}", name, payload.value("text", ""));
    } else if (name == "error") {
        std::println("{}: {}", name, payload.value("message", ""));
    } else if (name == "download-progress") {
        auto done = payload.value("downloaded_bytes", uint64_t{0});
        auto total = payload.value("total_bytes", uint64_t{0});
        if (total > 0) {
            std::println("{}: {} {:.1f}%", name, payload.value("item", ""), 100.0 * done / total);
        } else {
            std::println("{}: {} {} bytes", name, payload.value("item", ""), done);
        }
    } else {
        std::println("{}: {}", name, payload.dump());
    }
}

int listen(UnixSocketClient& client) {
    json msg;
    while (client.recv(msg, -1)) {
        if (msg.contains("event")) print_event(msg);
    }
    std::println(stderr, "Connection to daemon closed");
    return 1;
}

void print_response(const std::string& command, const json& response) {
    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Provider: {}", response.value("provider", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
    } else if (command == "devices") {
        for (auto& d : response.value("devices", json::array())) {
            std::println("{} {} ({})", d.value("is_default", false) ? "*" : " ",
                         d.value("name", ""), d.value("description", ""));
        }
    } else if (command == "providers") {
        for (auto& p : response.value("providers", json::array())) {
            std::println("{} {:<16} {}{}", p.value("active", false) ? "*" : " ",
                         p.value("id", ""), p.value("name", ""),
                         p.value("available", false) ? "" : " (unavailable)");
        }
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] ({}) {}", entry.value("timestamp", ""),
                         entry.value("provider", ""), entry.value("text", ""));
        }
    } else if (command == "get_settings" || command == "save_settings") {
        std::println("{}", response.value("settings", json::object()).dump(2));
    } else if (command == "gpu_status") {
        std::println("Library: {} ({})", response.value("library_path", ""),
                     response.value("library_present", false) ? "present" : "missing");
        std::println("Model:   {}", response.value("model_path", ""));
        std::println("Loaded:  {}", response.value("loaded", false) ? "yes" : "no");
        for (auto& m : response.value("models", json::array())) {
            std::println("  {} {:<20} {}", m.value("present", false) ? "*" : " ",
                         m.value("filename", ""), m.value("size", ""));
        }
    } else if (command == "download_model") {
        std::println("Downloading {} (follow progress with `voxpaste listen`)",
                     response.value("model", ""));
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else {
        std::println("OK");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string device, provider, model, file, settings;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--provider" && i + 1 < argc) {
            provider = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            settings = argv[++i];
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    json cmd;
    int timeout_ms = 30000;
    if (command == "start" || command == "toggle") {
        cmd = {{"cmd", command}};
        if (!device.empty()) cmd["device"] = device;
        if (command == "toggle") timeout_ms = kTranscribeTimeoutMs;
    } else if (command == "stop") {
        cmd = {{"cmd", "stop"}};
        timeout_ms = kTranscribeTimeoutMs;
    } else if (command == "status" || command == "devices" || command == "providers" ||
               command == "get_settings" || command == "clear_history" ||
               command == "gpu_status" || command == "subscribe") {
        cmd = {{"cmd", command}};
    } else if (command == "listen") {
        cmd = {{"cmd", "subscribe"}};
    } else if (command == "set_provider") {
        if (provider.empty()) {
            std::println(stderr, "set_provider requires --provider ID");
            return 1;
        }
        cmd = {{"cmd", "set_provider"}, {"provider", provider}};
    } else if (command == "save_settings") {
        try {
            cmd = {{"cmd", "save_settings"}, {"settings", json::parse(settings)}};
        } catch (const json::exception& e) {
            std::println(stderr, "--settings must be a JSON object: {}", e.what());
            return 1;
        }
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "transcribe_file") {
        if (file.empty()) {
            std::println(stderr, "transcribe_file requires --file PATH");
            return 1;
        }
        cmd = {{"cmd", "transcribe_file"}, {"path", file}};
        if (!provider.empty()) cmd["provider"] = provider;
        timeout_ms = kTranscribeTimeoutMs;
    } else if (command == "download_model") {
        cmd = {{"cmd", "download_model"}};
        if (!model.empty()) cmd["model"] = model;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voxpasted running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "listen" || command == "subscribe") {
        return listen(client);
    }

    print_response(command, response);
    return 0;
}
