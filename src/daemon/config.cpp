#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void read_optional(const json& j, const char* key, std::optional<std::string>& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

void write_optional(json& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

} // namespace

ProviderConfig Config::provider_config(ProviderId id) const {
    ProviderConfig pc;
    if (auto it = providers.find(id); it != providers.end()) {
        pc = it->second;
    }
    if (!pc.language) {
        pc.language = language;
    }
    return pc;
}

Config Config::from_json(const json& j) {
    Config cfg;

    if (j.contains("active_provider")) {
        auto name = j["active_provider"].get<std::string>();
        if (auto id = provider_id_from_string(name)) {
            cfg.active_provider = *id;
        } else {
            std::println(stderr, "config: unknown provider '{}', keeping default", name);
        }
    }
    if (j.contains("language")) cfg.language = j["language"].get<std::string>();
    if (j.contains("input_device")) cfg.input_device = j["input_device"].get<std::string>();

    if (j.contains("output")) {
        auto& o = j["output"];
        if (o.contains("auto_paste")) cfg.output.auto_paste = o["auto_paste"].get<bool>();
    }

    if (j.contains("history")) {
        auto& h = j["history"];
        if (h.contains("max_entries")) cfg.history.max_entries = h["max_entries"].get<int>();
    }

    if (j.contains("gpu_whisper")) {
        auto& g = j["gpu_whisper"];
        if (g.contains("library_path")) cfg.gpu_whisper.library_path = g["library_path"].get<std::string>();
        if (g.contains("model_path")) cfg.gpu_whisper.model_path = g["model_path"].get<std::string>();
        if (g.contains("model_name")) cfg.gpu_whisper.model_name = g["model_name"].get<std::string>();
        if (g.contains("implementation")) cfg.gpu_whisper.implementation = g["implementation"].get<std::string>();
        if (g.contains("flags")) cfg.gpu_whisper.flags = g["flags"].get<uint32_t>();
        if (g.contains("adapter")) cfg.gpu_whisper.adapter = g["adapter"].get<std::string>();
        if (g.contains("strategy")) cfg.gpu_whisper.strategy = g["strategy"].get<std::string>();
        if (g.contains("threads")) cfg.gpu_whisper.threads = g["threads"].get<int>();
        if (g.contains("download_url")) cfg.gpu_whisper.download_url = g["download_url"].get<std::string>();
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, p] : j["providers"].items()) {
            auto id = provider_id_from_string(name);
            if (!id) {
                std::println(stderr, "config: ignoring settings for unknown provider '{}'", name);
                continue;
            }
            ProviderConfig pc;
            read_optional(p, "api_key", pc.api_key);
            read_optional(p, "model", pc.model);
            read_optional(p, "language", pc.language);
            read_optional(p, "endpoint", pc.endpoint);
            cfg.providers[*id] = std::move(pc);
        }
    }

    return cfg;
}

json Config::to_json() const {
    json j = {
        {"active_provider", std::string(to_string(active_provider))},
        {"language", language},
        {"input_device", input_device},
        {"output", {{"auto_paste", output.auto_paste}}},
        {"history", {{"max_entries", history.max_entries}}},
        {"gpu_whisper", {
            {"library_path", gpu_whisper.library_path},
            {"model_path", gpu_whisper.model_path},
            {"model_name", gpu_whisper.model_name},
            {"implementation", gpu_whisper.implementation},
            {"flags", gpu_whisper.flags},
            {"adapter", gpu_whisper.adapter},
            {"strategy", gpu_whisper.strategy},
            {"threads", gpu_whisper.threads},
            {"download_url", gpu_whisper.download_url},
        }},
        {"providers", json::object()},
    };

    for (auto& [id, pc] : providers) {
        json p = json::object();
        write_optional(p, "api_key", pc.api_key);
        write_optional(p, "model", pc.model);
        write_optional(p, "language", pc.language);
        write_optional(p, "endpoint", pc.endpoint);
        j["providers"][std::string(to_string(id))] = std::move(p);
    }
    return j;
}

bool Config::save(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "config: could not write {}", path);
        return false;
    }
    f << to_json().dump(2) << '\n';
    return f.good();
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }

    try {
        return from_json(json::parse(f));
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }
    return Config{};
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto path = default_path();
    if (!path.empty() && fs::exists(path)) {
        return load(path);
    }
    return Config{};
}
