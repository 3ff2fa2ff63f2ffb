#pragma once

#include "captured_audio.hpp"

#include <cstdint>
#include <limits>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

// Accumulates samples for one recording.
// Producer (PipeWire thread) appends; consumer (main thread) drains on stop.
// The only work done under the lock is a copy, so the audio thread never waits long.
class CaptureBuffer {
public:
    // Clear any previous recording and record the negotiated stream format.
    void reset(uint32_t sample_rate = 0, uint16_t channels = 0) {
        std::lock_guard lock(mu_);
        samples_.clear();
        sample_rate_ = sample_rate;
        channels_ = channels;
    }

    void set_format(uint32_t sample_rate, uint16_t channels) {
        std::lock_guard lock(mu_);
        sample_rate_ = sample_rate;
        channels_ = channels;
    }

    void append(std::span<const float> data) {
        std::lock_guard lock(mu_);
        samples_.insert(samples_.end(), data.begin(), data.end());
    }

    // 16-bit integer sources are normalized by the format's maximum magnitude.
    void append_pcm16(std::span<const int16_t> data) {
        constexpr float scale = static_cast<float>(std::numeric_limits<int16_t>::max());
        std::lock_guard lock(mu_);
        samples_.reserve(samples_.size() + data.size());
        for (int16_t s : data) {
            samples_.push_back(static_cast<float>(s) / scale);
        }
    }

    // Swap out everything captured so far; the buffer is left empty.
    CapturedAudio drain() {
        CapturedAudio out;
        std::lock_guard lock(mu_);
        out.samples = std::exchange(samples_, {});
        out.sample_rate = sample_rate_;
        out.channels = channels_;
        return out;
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return samples_.size();
    }

private:
    mutable std::mutex mu_;
    std::vector<float> samples_;
    uint32_t sample_rate_ = 0;
    uint16_t channels_ = 0;
};
