#include "providers/lan_provider.hpp"

#include "audio/captured_audio.hpp"
#include "audio/wav.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<TranscriptionResult, Error>
LanProvider::transcribe(std::span<const float> audio, const ProviderConfig& config) {
    if (audio.empty()) {
        return std::unexpected(transcribe_error("no audio captured"));
    }

    auto start = std::chrono::steady_clock::now();
    auto wav_data = wav::encode(audio, kCanonicalSampleRate);

    std::vector<http::FormField> fields = {
        {.name = "file",
         .value = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
         .filename = "audio.wav",
         .content_type = "audio/wav"},
        {.name = "temperature", .value = "0.0"},
        {.name = "response_format", .value = "json"},
    };
    if (!is_auto_language(config.language)) {
        fields.push_back({.name = "language", .value = *config.language});
    }

    std::string endpoint = config.endpoint.value_or(kDefaultEndpoint);
    auto resp = http::post_multipart(endpoint + "/inference", fields);
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        if (j.contains("error")) {
            return std::unexpected(transcribe_error("server error: " + j["error"].dump()));
        }
        if (!resp->ok() || !j.contains("text")) {
            return std::unexpected(transcribe_error(
                std::format("unexpected response (HTTP {}): {}", resp->status, resp->body)));
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        return TranscriptionResult{
            .text = http::trim(j["text"].get<std::string>()),
            .provider = id(),
            .duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()),
            .language = config.language,
        };
    } catch (const json::exception& e) {
        return std::unexpected(transcribe_error(std::string("JSON parse error: ") + e.what()));
    }
}
