#pragma once

#include "error.hpp"
#include "gpu_whisper/abi.hpp"
#include "gpu_whisper/foreign_ptr.hpp"

#include <expected>
#include <string>

namespace gpu_whisper {

class HostAudioBuffer;

class TranscribeResult {
public:
    explicit TranscribeResult(ForeignPtr<ITranscribeResultVtbl> ptr) : ptr_(std::move(ptr)) {}

    std::expected<sTranscribeLength, Error> size() const;

    // All segment texts concatenated in order, surrounding whitespace trimmed.
    std::expected<std::string, Error> text() const;

private:
    ForeignPtr<ITranscribeResultVtbl> ptr_;
};

// Scoped to a single transcription call.
class Context {
public:
    explicit Context(ForeignPtr<IContextVtbl> ptr) : ptr_(std::move(ptr)) {}

    std::expected<sFullParams, Error> default_params(eSamplingStrategy strategy) const;

    // Blocks until the library has processed the whole buffer.
    std::expected<void, Error> run_full(const sFullParams& params, HostAudioBuffer& audio) const;

    std::expected<TranscribeResult, Error> results() const;

private:
    ForeignPtr<IContextVtbl> ptr_;
};

// A loaded model; outlives many contexts.
class Model {
public:
    explicit Model(ForeignPtr<IModelVtbl> ptr) : ptr_(std::move(ptr)) {}

    std::expected<Context, Error> create_context() const;
    bool is_multilingual() const;

private:
    ForeignPtr<IModelVtbl> ptr_;
};

} // namespace gpu_whisper
