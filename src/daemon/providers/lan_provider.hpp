#pragma once

#include "providers/http_client.hpp"
#include "providers/provider.hpp"

// whisper.cpp server reachable over the local network.
class LanProvider : public SttProvider {
public:
    static constexpr const char* kDefaultEndpoint = "http://localhost:8080";

    ProviderId id() const override { return ProviderId::LanWhisper; }
    std::string_view name() const override { return "LAN Whisper server"; }
    bool is_available() const override { return true; }

    std::expected<TranscriptionResult, Error>
        transcribe(std::span<const float> audio, const ProviderConfig& config) override;

private:
    http::CurlGlobal curl_;
};
