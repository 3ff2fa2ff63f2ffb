#pragma once

#include "providers/http_client.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

// Google Cloud Speech-to-Text v1 recognize (synchronous, base64 WAV in JSON).
class GoogleProvider : public SttProvider {
public:
    static constexpr const char* kDefaultEndpoint = "https://speech.googleapis.com/v1/speech:recognize";
    static constexpr const char* kDefaultLanguage = "en-US";
    static constexpr const char* kDefaultModel = "default";

    ProviderId id() const override { return ProviderId::GoogleCloud; }
    std::string_view name() const override { return "Google Cloud Speech"; }
    bool is_available() const override { return true; }

    std::expected<TranscriptionResult, Error>
        transcribe(std::span<const float> audio, const ProviderConfig& config) override;

    static nlohmann::json build_request(std::span<const uint8_t> wav_data,
                                        const ProviderConfig& config);
    // First alternative of the first result; empty when nothing was recognized.
    static std::string extract_transcript(const nlohmann::json& response);

private:
    http::CurlGlobal curl_;
};
