#pragma once

#include "gpu_whisper/abi.hpp"

#include <atomic>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace gpu_whisper {

// Host-implemented audio buffer exposed to the library through the same
// function-table convention as the library's own objects. It holds its own
// copy of the canonical samples and frees itself when its reference count
// drops to zero, whichever side performs that last Release.
class HostAudioBuffer {
public:
    // Returns a new object whose single reference belongs to the caller.
    static HostAudioBuffer* create(std::vector<float> samples);

    HostAudioBuffer(const HostAudioBuffer&) = delete;
    HostAudioBuffer& operator=(const HostAudioBuffer&) = delete;

    uint32_t add_ref();
    uint32_t release();

    uint32_t ref_count() const { return ref_count_.load(std::memory_order_acquire); }
    std::span<const float> samples() const { return samples_; }

    // Pointer handed across the boundary as an iAudioBuffer*.
    void* as_foreign() { return this; }

    // Number of buffers currently alive in this process.
    static int32_t live_instances() { return live_.load(std::memory_order_acquire); }

private:
    explicit HostAudioBuffer(std::vector<float> samples);
    ~HostAudioBuffer();

    static HRESULT query_interface(void* self, const GUID* iid, void** out);
    static uint32_t add_ref_thunk(void* self);
    static uint32_t release_thunk(void* self);
    static uint32_t count_samples(const void* self);
    static const float* pcm_mono(const void* self);
    static const float* pcm_stereo(const void* self);
    static HRESULT get_time(const void* self, int64_t* time);

    static const IAudioBufferVtbl vtbl_;
    static std::atomic<int32_t> live_;

    // Must stay the first member: the library reads the table pointer from offset 0.
    const IAudioBufferVtbl* vtbl_ptr_;
    std::atomic<uint32_t> ref_count_{1};
    std::vector<float> samples_;
};

// The host's own reference to a HostAudioBuffer; released on destruction.
class HostAudioBufferRef {
public:
    explicit HostAudioBufferRef(std::vector<float> samples)
        : buf_(HostAudioBuffer::create(std::move(samples))) {}
    ~HostAudioBufferRef() { reset(); }

    HostAudioBufferRef(const HostAudioBufferRef&) = delete;
    HostAudioBufferRef& operator=(const HostAudioBufferRef&) = delete;
    HostAudioBufferRef(HostAudioBufferRef&& other) noexcept
        : buf_(std::exchange(other.buf_, nullptr)) {}

    // Drops the host reference. Returns the count left for the library's references.
    uint32_t reset() {
        if (auto* b = std::exchange(buf_, nullptr)) return b->release();
        return 0;
    }

    HostAudioBuffer* get() const { return buf_; }
    HostAudioBuffer* operator->() const { return buf_; }

private:
    HostAudioBuffer* buf_;
};

} // namespace gpu_whisper
