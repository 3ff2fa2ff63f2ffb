#pragma once

#include "providers/http_client.hpp"
#include "providers/provider.hpp"

// OpenAI-compatible transcription endpoint (multipart upload of a WAV file).
class OpenAiProvider : public SttProvider {
public:
    static constexpr const char* kDefaultEndpoint = "https://api.openai.com/v1/audio/transcriptions";
    static constexpr const char* kDefaultModel = "whisper-1";

    ProviderId id() const override { return ProviderId::OpenAiWhisper; }
    std::string_view name() const override { return "OpenAI Whisper"; }
    bool is_available() const override { return true; }

    std::expected<TranscriptionResult, Error>
        transcribe(std::span<const float> audio, const ProviderConfig& config) override;

private:
    http::CurlGlobal curl_;
};
