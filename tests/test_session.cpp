#include <catch2/catch_test_macros.hpp>

#include "audio/capture_buffer.hpp"
#include "platform/audio_capture.hpp"
#include "session.hpp"

#include <vector>

class MockAudioCapture : public AudioCapture {
public:
    std::vector<InputDevice> list_devices() override {
        return {{.name = "mic", .description = "Test mic", .is_default = true}};
    }
    std::expected<void, Error> start(const std::string& device) override {
        last_device = device;
        if (fail_start) return std::unexpected(device_error("no input devices"));
        capturing_ = true;
        return {};
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }

    bool fail_start = false;
    std::string last_device;

private:
    bool capturing_ = false;
};

TEST_CASE("Session state machine", "[session]") {
    CaptureBuffer buffer;
    MockAudioCapture capture;
    Session session(buffer, capture);

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StopWhenIdleReturnsEmpty") {
        auto audio = session.stop_recording();
        REQUIRE(audio.empty());
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StartRecording") {
        REQUIRE(session.start_recording("mic").has_value());
        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE(capture.is_capturing());
        REQUIRE(capture.last_device == "mic");
    }

    SECTION("StartClearsPreviousAudio") {
        buffer.reset(16000, 1);
        std::vector<float> stale(100, 0.5f);
        buffer.append(stale);

        REQUIRE(session.start_recording("").has_value());
        REQUIRE(buffer.size() == 0);
    }

    SECTION("StartWhileRecordingRejected") {
        REQUIRE(session.start_recording("").has_value());
        auto r = session.start_recording("");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Device);
        REQUIRE(session.state() == SessionState::Recording);
    }

    SECTION("CaptureFailureStaysIdle") {
        capture.fail_start = true;
        auto r = session.start_recording("");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Device);
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StopDrainsCapturedAudio") {
        REQUIRE(session.start_recording("").has_value());
        buffer.set_format(48000, 2);
        std::vector<float> block = {0.1f, 0.2f, 0.3f, 0.4f};
        buffer.append(block);

        auto audio = session.stop_recording();
        REQUIRE(session.state() == SessionState::Draining);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(audio.samples == block);
        REQUIRE(audio.sample_rate == 48000);
        REQUIRE(audio.channels == 2);
    }

    SECTION("FullCycle") {
        REQUIRE(session.start_recording("").has_value());
        session.stop_recording();
        session.set_transcribing();
        REQUIRE(session.state() == SessionState::Transcribing);
        session.set_idle();
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("SetTranscribingFromIdle") {
        session.set_transcribing();
        REQUIRE(session.state() == SessionState::Transcribing);
    }

    SECTION("RecordingDurationZeroWhenIdle") {
        REQUIRE(session.recording_duration() == 0.0);
    }

    SECTION("RecordingDurationAdvances") {
        REQUIRE(session.start_recording("").has_value());
        REQUIRE(session.recording_duration() >= 0.0);
    }

    SECTION("StateNames") {
        REQUIRE(to_string(SessionState::Idle) == "idle");
        REQUIRE(to_string(SessionState::Draining) == "draining");
        REQUIRE(to_string(SessionState::Transcribing) == "transcribing");
    }
}
