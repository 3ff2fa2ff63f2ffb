#pragma once

#include "audio/capture_buffer.hpp"
#include "platform/audio_capture.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Records from a PipeWire source node at its native rate and channel layout.
// Samples are appended to the CaptureBuffer from the PipeWire data thread.
class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(CaptureBuffer& buffer);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::vector<InputDevice> list_devices() override;
    std::expected<void, Error> start(const std::string& device) override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_param_changed(void* userdata, uint32_t id, const spa_pod* param);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    CaptureBuffer& buffer_;
    std::atomic<bool> capturing_{false};
    std::atomic<uint32_t> sample_format_{SPA_AUDIO_FORMAT_UNKNOWN};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};
