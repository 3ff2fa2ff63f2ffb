#pragma once

#include "audio/capture_buffer.hpp"
#include "error.hpp"
#include "platform/audio_capture.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

// Idle -> Recording -> Draining -> Transcribing -> Idle.
// A failure in any state reports an error and returns to Idle.
enum class SessionState { Idle, Recording, Draining, Transcribing };

std::string_view to_string(SessionState state);

// Recording state machine. Owned and driven by the event-loop thread only;
// the capture thread touches nothing but the CaptureBuffer.
class Session {
public:
    Session(CaptureBuffer& buffer, AudioCapture& capture);

    std::expected<void, Error> start_recording(const std::string& device);

    // Recording -> Draining. Stops the stream and swaps out everything
    // captured; the result is empty when nothing arrived or not recording.
    CapturedAudio stop_recording();

    // Draining -> Transcribing, or Idle -> Transcribing for file input.
    void set_transcribing();
    void set_idle();

    SessionState state() const { return state_; }
    double recording_duration() const;

private:
    CaptureBuffer& buffer_;
    AudioCapture& capture_;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
