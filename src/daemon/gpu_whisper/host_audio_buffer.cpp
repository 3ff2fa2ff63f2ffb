#include "gpu_whisper/host_audio_buffer.hpp"

#include <cstddef>

namespace gpu_whisper {

const IAudioBufferVtbl HostAudioBuffer::vtbl_ = {
    .QueryInterface = &HostAudioBuffer::query_interface,
    .AddRef = &HostAudioBuffer::add_ref_thunk,
    .Release = &HostAudioBuffer::release_thunk,
    .countSamples = &HostAudioBuffer::count_samples,
    .getPcmMono = &HostAudioBuffer::pcm_mono,
    .getPcmStereo = &HostAudioBuffer::pcm_stereo,
    .getTime = &HostAudioBuffer::get_time,
};

std::atomic<int32_t> HostAudioBuffer::live_{0};

HostAudioBuffer::HostAudioBuffer(std::vector<float> samples)
    : vtbl_ptr_(&vtbl_), samples_(std::move(samples)) {
    live_.fetch_add(1, std::memory_order_relaxed);
}

HostAudioBuffer::~HostAudioBuffer() {
    live_.fetch_sub(1, std::memory_order_release);
}

HostAudioBuffer* HostAudioBuffer::create(std::vector<float> samples) {
    return new HostAudioBuffer(std::move(samples));
}

uint32_t HostAudioBuffer::add_ref() {
    return ref_count_.fetch_add(1, std::memory_order_relaxed) + 1;
}

uint32_t HostAudioBuffer::release() {
    uint32_t prev = ref_count_.fetch_sub(1, std::memory_order_release);
    if (prev == 1) {
        std::atomic_thread_fence(std::memory_order_acquire);
        delete this;
        return 0;
    }
    return prev - 1;
}

HRESULT HostAudioBuffer::query_interface(void* /*self*/, const GUID* /*iid*/, void** out) {
    // No secondary interfaces; the library uses the pointer it was given.
    if (out) *out = nullptr;
    return E_NOINTERFACE;
}

uint32_t HostAudioBuffer::add_ref_thunk(void* self) {
    return static_cast<HostAudioBuffer*>(self)->add_ref();
}

uint32_t HostAudioBuffer::release_thunk(void* self) {
    return static_cast<HostAudioBuffer*>(self)->release();
}

uint32_t HostAudioBuffer::count_samples(const void* self) {
    return static_cast<uint32_t>(static_cast<const HostAudioBuffer*>(self)->samples_.size());
}

const float* HostAudioBuffer::pcm_mono(const void* self) {
    return static_cast<const HostAudioBuffer*>(self)->samples_.data();
}

const float* HostAudioBuffer::pcm_stereo(const void* /*self*/) {
    return nullptr;
}

HRESULT HostAudioBuffer::get_time(const void* /*self*/, int64_t* time) {
    if (time) *time = 0;
    return S_OK;
}

} // namespace gpu_whisper
