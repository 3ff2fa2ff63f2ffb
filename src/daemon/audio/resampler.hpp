#pragma once

#include <cstdint>
#include <span>
#include <vector>

// Mix interleaved audio down to mono (mean across channels, incomplete
// trailing frames dropped) and resample to 16 kHz by linear interpolation.
std::vector<float> resample_to_16k_mono(std::span<const float> input,
                                        uint32_t sample_rate, uint16_t channels);
