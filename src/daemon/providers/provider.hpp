#pragma once

#include "config.hpp"
#include "error.hpp"
#include "providers/provider_types.hpp"

#include <expected>
#include <span>
#include <string_view>

// A speech-to-text backend. Every backend consumes canonical audio
// (mono, 16 kHz, float in [-1, 1]) and produces the same result record.
class SttProvider {
public:
    virtual ~SttProvider() = default;

    virtual ProviderId id() const = 0;
    virtual std::string_view name() const = 0;

    // Evaluated on every query; implementations must not block on inference.
    virtual bool is_available() const = 0;

    virtual std::expected<TranscriptionResult, Error>
        transcribe(std::span<const float> audio, const ProviderConfig& config) = 0;

    // Called when settings change. Most backends read everything they need
    // from the per-call ProviderConfig and ignore this.
    virtual void configure(const Config& /*config*/) {}
};
