#include "providers/google_provider.hpp"

#include "audio/captured_audio.hpp"
#include "audio/wav.hpp"

#include <chrono>
#include <format>

using json = nlohmann::json;

namespace {

std::string language_code(const ProviderConfig& config) {
    if (is_auto_language(config.language)) return GoogleProvider::kDefaultLanguage;
    return *config.language;
}

} // namespace

json GoogleProvider::build_request(std::span<const uint8_t> wav_data, const ProviderConfig& config) {
    return {
        {"config", {
            {"encoding", "LINEAR16"},
            {"sampleRateHertz", kCanonicalSampleRate},
            {"languageCode", language_code(config)},
            {"model", config.model.value_or(kDefaultModel)},
        }},
        {"audio", {{"content", http::base64_encode(wav_data)}}},
    };
}

std::string GoogleProvider::extract_transcript(const json& response) {
    if (!response.contains("results") || !response["results"].is_array() ||
        response["results"].empty()) {
        return {};
    }
    auto& first = response["results"][0];
    if (!first.contains("alternatives") || first["alternatives"].empty()) return {};

    auto& alt = first["alternatives"][0];
    if (!alt.contains("transcript")) return {};
    return http::trim(alt["transcript"].get<std::string>());
}

std::expected<TranscriptionResult, Error>
GoogleProvider::transcribe(std::span<const float> audio, const ProviderConfig& config) {
    if (audio.empty()) {
        return std::unexpected(transcribe_error("no audio captured"));
    }
    if (!config.api_key || config.api_key->empty()) {
        return std::unexpected(config_error("Google Cloud API key is not set"));
    }

    auto start = std::chrono::steady_clock::now();
    auto wav_data = wav::encode(audio, kCanonicalSampleRate);
    auto request = build_request(wav_data, config);

    std::string url = config.endpoint.value_or(kDefaultEndpoint) + "?key=" + *config.api_key;
    auto resp = http::post_json(url, request.dump());
    if (!resp) return std::unexpected(resp.error());

    if (!resp->ok()) {
        return std::unexpected(transcribe_error(
            std::format("Google Cloud returned HTTP {}: {}", resp->status, resp->body)));
    }

    try {
        auto text = extract_transcript(json::parse(resp->body));
        auto elapsed = std::chrono::steady_clock::now() - start;
        return TranscriptionResult{
            .text = std::move(text),
            .provider = id(),
            .duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()),
            .language = language_code(config),
        };
    } catch (const json::exception& e) {
        return std::unexpected(transcribe_error(std::string("JSON parse error: ") + e.what()));
    }
}
