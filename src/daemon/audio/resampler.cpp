#include "audio/resampler.hpp"

#include "audio/captured_audio.hpp"

std::vector<float> resample_to_16k_mono(std::span<const float> input,
                                        uint32_t sample_rate, uint16_t channels) {
    if (input.empty() || channels == 0 || sample_rate == 0) {
        return {};
    }

    std::vector<float> mono;
    if (channels == 1) {
        mono.assign(input.begin(), input.end());
    } else {
        size_t frames = input.size() / channels;
        mono.reserve(frames);
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                sum += input[f * channels + c];
            }
            mono.push_back(sum / static_cast<float>(channels));
        }
    }

    if (sample_rate == kCanonicalSampleRate) {
        return mono;
    }

    double ratio = static_cast<double>(kCanonicalSampleRate) / sample_rate;
    auto output_len = static_cast<size_t>(static_cast<double>(mono.size()) * ratio);

    std::vector<float> output;
    output.reserve(output_len);
    for (size_t i = 0; i < output_len; ++i) {
        double src_pos = static_cast<double>(i) / ratio;
        auto src_idx = static_cast<size_t>(src_pos);
        auto frac = static_cast<float>(src_pos - static_cast<double>(src_idx));

        if (src_idx + 1 < mono.size()) {
            output.push_back(mono[src_idx] * (1.0f - frac) + mono[src_idx + 1] * frac);
        } else if (src_idx < mono.size()) {
            output.push_back(mono[src_idx]);
        }
    }
    return output;
}
