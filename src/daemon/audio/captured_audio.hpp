#pragma once

#include <cstdint>
#include <vector>

// Raw interleaved samples as delivered by the capture device.
struct CapturedAudio {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;

    bool empty() const { return samples.empty(); }
};

constexpr uint32_t kCanonicalSampleRate = 16000;
