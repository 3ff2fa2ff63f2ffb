#include "providers/openai_provider.hpp"

#include "audio/captured_audio.hpp"
#include "audio/wav.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<TranscriptionResult, Error>
OpenAiProvider::transcribe(std::span<const float> audio, const ProviderConfig& config) {
    if (audio.empty()) {
        return std::unexpected(transcribe_error("no audio captured"));
    }
    if (!config.api_key || config.api_key->empty()) {
        return std::unexpected(config_error("OpenAI API key is not set"));
    }

    auto start = std::chrono::steady_clock::now();
    auto wav_data = wav::encode(audio, kCanonicalSampleRate);

    std::string model = config.model.value_or(kDefaultModel);
    std::vector<http::FormField> fields = {
        {.name = "file",
         .value = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
         .filename = "audio.wav",
         .content_type = "audio/wav"},
        {.name = "model", .value = model},
        {.name = "response_format", .value = "json"},
    };
    if (!is_auto_language(config.language)) {
        fields.push_back({.name = "language", .value = *config.language});
    }

    std::string endpoint = config.endpoint.value_or(kDefaultEndpoint);
    auto resp = http::post_multipart(endpoint, fields,
                                     {"Authorization: Bearer " + *config.api_key});
    if (!resp) return std::unexpected(resp.error());

    if (!resp->ok()) {
        return std::unexpected(transcribe_error(
            std::format("OpenAI returned HTTP {}: {}", resp->status, resp->body)));
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.contains("text")) {
            return std::unexpected(transcribe_error("unexpected response: " + resp->body));
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        TranscriptionResult result{
            .text = http::trim(j["text"].get<std::string>()),
            .provider = id(),
            .duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()),
            .language = config.language,
        };
        if (j.contains("language") && j["language"].is_string()) {
            result.language = j["language"].get<std::string>();
        }
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(transcribe_error(std::string("JSON parse error: ") + e.what()));
    }
}
