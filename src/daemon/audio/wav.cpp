#include "audio/wav.hpp"

#include <format>
#include <string>

namespace wav {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t rd16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t rd32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

std::expected<CapturedAudio, Error> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected(transcribe_error("not a RIFF/WAVE file"));
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = rd32(chunk + 4);
        size_t body = pos + 8;
        if (body + size > bytes.size()) {
            // Truncated data chunks are common in streamed recordings; clamp them.
            if (!tag_is(chunk, "data")) {
                return std::unexpected(transcribe_error("truncated WAV chunk"));
            }
            size = static_cast<uint32_t>(bytes.size() - body);
        }

        if (tag_is(chunk, "fmt ")) {
            if (size < 16) {
                return std::unexpected(transcribe_error("fmt chunk too small"));
            }
            format = rd16(bytes.data() + body);
            channels = rd16(bytes.data() + body + 2);
            sample_rate = rd32(bytes.data() + body + 4);
            bits = rd16(bytes.data() + body + 14);
            if (format == kFormatExtensible && size >= 26) {
                // Sub-format GUID starts with the plain format code.
                format = rd16(bytes.data() + body + 24);
            }
            have_fmt = true;
        } else if (tag_is(chunk, "data")) {
            if (!have_fmt) {
                return std::unexpected(transcribe_error("data chunk before fmt chunk"));
            }
            if (channels == 0 || sample_rate == 0) {
                return std::unexpected(transcribe_error("invalid channel count or sample rate"));
            }

            CapturedAudio out;
            out.sample_rate = sample_rate;
            out.channels = channels;
            const uint8_t* data = bytes.data() + body;

            if (format == kFormatPcm && bits == 16) {
                size_t n = size / 2;
                out.samples.reserve(n);
                for (size_t i = 0; i < n; ++i) {
                    auto s = static_cast<int16_t>(rd16(data + i * 2));
                    out.samples.push_back(static_cast<float>(s) /
                                          static_cast<float>(std::numeric_limits<int16_t>::max()));
                }
            } else if (format == kFormatFloat && bits == 32) {
                size_t n = size / 4;
                out.samples.resize(n);
                std::memcpy(out.samples.data(), data, n * sizeof(float));
            } else {
                return std::unexpected(transcribe_error(
                    std::format("unsupported WAV encoding (format {}, {} bits)", format, bits)));
            }
            return out;
        }

        pos = body + size + (size & 1);
    }

    return std::unexpected(transcribe_error("WAV file has no data chunk"));
}

} // namespace wav
