#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class ProviderId { OpenAiWhisper, GoogleCloud, LanWhisper, GpuWhisper };

// Stable identifiers used in config files and IPC messages.
std::string_view to_string(ProviderId id);
std::optional<ProviderId> provider_id_from_string(std::string_view s);

struct ProviderConfig {
    std::optional<std::string> api_key;
    std::optional<std::string> model;
    std::optional<std::string> language;
    std::optional<std::string> endpoint;
};

struct TranscriptionResult {
    std::string text;
    ProviderId provider = ProviderId::OpenAiWhisper;
    uint64_t duration_ms = 0;
    std::optional<std::string> language;
    double audio_duration_s = 0.0;
};

// "auto" and unset both mean: let the backend detect the language.
inline bool is_auto_language(const std::optional<std::string>& lang) {
    return !lang || lang->empty() || *lang == "auto";
}
