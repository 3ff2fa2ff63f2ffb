#include "session.hpp"

#include <format>
#include <print>

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Draining: return "draining";
        case SessionState::Transcribing: return "transcribing";
    }
    return "unknown";
}

Session::Session(CaptureBuffer& buffer, AudioCapture& capture)
    : buffer_(buffer), capture_(capture) {}

std::expected<void, Error> Session::start_recording(const std::string& device) {
    if (state_ != SessionState::Idle) {
        return std::unexpected(device_error(
            std::format("cannot start recording while {}", to_string(state_))));
    }

    buffer_.reset();
    if (auto r = capture_.start(device); !r) {
        std::println(stderr, "session: failed to start audio capture: {}", r.error().message);
        return r;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return {};
}

CapturedAudio Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return {};
    }

    capture_.stop();
    state_ = SessionState::Draining;
    return buffer_.drain();
}

void Session::set_transcribing() {
    state_ = SessionState::Transcribing;
}

void Session::set_idle() {
    state_ = SessionState::Idle;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
