#include "gpu_whisper/objects.hpp"

#include "gpu_whisper/host_audio_buffer.hpp"

#include <cstring>

namespace gpu_whisper {

std::expected<Context, Error> Model::create_context() const {
    void* raw = nullptr;
    HRESULT hr = ptr_.vtbl()->createContext(ptr_.get(), &raw);
    // Adopt whatever came back before looking at the status, so a context
    // returned alongside a failure code is still released.
    ForeignPtr<IContextVtbl> ctx(raw);
    if (failed(hr)) {
        return std::unexpected(inference_error("iModel::createContext", hr));
    }
    if (!ctx) {
        return std::unexpected(inference_error("iModel::createContext", E_POINTER));
    }
    return Context(std::move(ctx));
}

bool Model::is_multilingual() const {
    return ptr_.vtbl()->isMultilingual(ptr_.get()) == S_OK;
}

std::expected<sFullParams, Error> Context::default_params(eSamplingStrategy strategy) const {
    sFullParams params;
    std::memset(&params, 0, sizeof(params));
    HRESULT hr = ptr_.vtbl()->fullDefaultParams(ptr_.get(), strategy, &params);
    if (failed(hr)) {
        return std::unexpected(inference_error("iContext::fullDefaultParams", hr));
    }
    return params;
}

std::expected<void, Error> Context::run_full(const sFullParams& params,
                                             HostAudioBuffer& audio) const {
    HRESULT hr = ptr_.vtbl()->runFull(ptr_.get(), &params, audio.as_foreign());
    if (failed(hr)) {
        return std::unexpected(inference_error("iContext::runFull", hr));
    }
    return {};
}

std::expected<TranscribeResult, Error> Context::results() const {
    void* raw = nullptr;
    HRESULT hr = ptr_.vtbl()->getResults(ptr_.get(), result_flags::None, &raw);
    ForeignPtr<ITranscribeResultVtbl> result(raw);
    if (failed(hr)) {
        return std::unexpected(inference_error("iContext::getResults", hr));
    }
    if (!result) {
        return std::unexpected(inference_error("iContext::getResults", E_POINTER));
    }
    return TranscribeResult(std::move(result));
}

std::expected<sTranscribeLength, Error> TranscribeResult::size() const {
    sTranscribeLength len{0, 0};
    HRESULT hr = ptr_.vtbl()->getSize(ptr_.get(), &len);
    if (failed(hr)) {
        return std::unexpected(inference_error("iTranscribeResult::getSize", hr));
    }
    return len;
}

std::expected<std::string, Error> TranscribeResult::text() const {
    auto len = size();
    if (!len) return std::unexpected(len.error());

    const sSegment* segments = ptr_.vtbl()->getSegments(ptr_.get());
    if (!segments || len->count_segments == 0) {
        return std::string{};
    }

    std::string text;
    for (uint32_t i = 0; i < len->count_segments; ++i) {
        if (segments[i].text) {
            text += segments[i].text;
        }
    }

    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return std::string{};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace gpu_whisper
