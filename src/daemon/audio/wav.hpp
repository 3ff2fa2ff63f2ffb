#pragma once

#include "audio/captured_audio.hpp"
#include "error.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <limits>
#include <span>
#include <vector>

// In-memory WAV container for the canonical audio handed to HTTP backends.
namespace wav {

// Clamp to [-1, 1] and scale to the signed 16-bit range.
inline std::vector<int16_t> to_pcm16(std::span<const float> samples) {
    constexpr float scale = static_cast<float>(std::numeric_limits<int16_t>::max());
    std::vector<int16_t> out;
    out.reserve(samples.size());
    for (float s : samples) {
        out.push_back(static_cast<int16_t>(std::clamp(s, -1.0f, 1.0f) * scale));
    }
    return out;
}

// Encodes raw PCM int16 mono samples into a WAV file in memory.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + 44, samples.data(), data_size);
    }

    return out;
}

inline std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate) {
    auto pcm = to_pcm16(samples);
    return encode(std::span<const int16_t>(pcm), sample_rate);
}

// Parses RIFF/WAVE with 16-bit PCM or 32-bit IEEE float data, any channel count.
std::expected<CapturedAudio, Error> decode(std::span<const uint8_t> bytes);

} // namespace wav
