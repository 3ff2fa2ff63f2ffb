#pragma once

#include "providers/provider_types.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

struct Config {
    ProviderId active_provider = ProviderId::OpenAiWhisper;
    std::string language = "auto";
    std::string input_device; // empty = system default

    struct Output {
        bool auto_paste = true;
    } output;

    struct History {
        int max_entries = 100;
    } history;

    struct GpuWhisper {
        std::string library_path; // empty = well-known location
        std::string model_path;   // empty = well-known location + model_name
        std::string model_name = "ggml-medium.bin";
        std::string implementation = "gpu"; // "gpu", "hybrid" or "reference"
        uint32_t flags = 0;
        std::string adapter;                 // empty = default GPU
        std::string strategy = "greedy";     // "greedy" or "beam"
        int threads = 0;                     // 0 = library default
        std::string download_url;            // mirror for model downloads; empty = catalog URLs
    } gpu_whisper;

    std::map<ProviderId, ProviderConfig> providers;

    // Effective per-backend config; the global language fills in when unset.
    ProviderConfig provider_config(ProviderId id) const;

    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);

    bool save(const std::string& path) const;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
