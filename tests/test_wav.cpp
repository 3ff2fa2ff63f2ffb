#include <catch2/catch_test_macros.hpp>

#include "audio/wav.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put(std::vector<uint8_t>& out, const void* data, size_t len) {
    auto* p = static_cast<const uint8_t*>(data);
    out.insert(out.end(), p, p + len);
}

void put16(std::vector<uint8_t>& out, uint16_t v) { put(out, &v, 2); }
void put32(std::vector<uint8_t>& out, uint32_t v) { put(out, &v, 4); }

// Hand-assembled WAV with an optional chunk before fmt.
std::vector<uint8_t> build_wav(uint16_t format, uint16_t channels, uint32_t rate,
                               uint16_t bits, const void* data, uint32_t data_size,
                               bool with_list_chunk = false) {
    std::vector<uint8_t> out;
    put(out, "RIFF", 4);
    put32(out, 0); // patched below
    put(out, "WAVE", 4);

    if (with_list_chunk) {
        put(out, "LIST", 4);
        put32(out, 5);
        put(out, "INFOx", 5);
        out.push_back(0); // pad byte for odd-sized chunk
    }

    put(out, "fmt ", 4);
    put32(out, 16);
    put16(out, format);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * bits / 8);
    put16(out, static_cast<uint16_t>(channels * bits / 8));
    put16(out, bits);

    put(out, "data", 4);
    put32(out, data_size);
    put(out, data, data_size);

    uint32_t riff = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff, 4);
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 16) == 16);
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 32) == 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }

    SECTION("FloatSamplesClamped") {
        std::vector<float> f = {0.0f, 1.0f, -1.0f, 2.5f, -7.0f};
        auto wav = wav::encode(std::span<const float>(f), sample_rate);
        auto* data = wav.data() + 44;
        REQUIRE(static_cast<int16_t>(read_u16(data)) == 0);
        REQUIRE(static_cast<int16_t>(read_u16(data + 2)) == 32767);
        REQUIRE(static_cast<int16_t>(read_u16(data + 4)) == -32767);
        REQUIRE(static_cast<int16_t>(read_u16(data + 6)) == 32767);
        REQUIRE(static_cast<int16_t>(read_u16(data + 8)) == -32767);
    }
}

TEST_CASE("wav::decode", "[wav]") {
    SECTION("ReadsOwnEncoding") {
        std::vector<float> f = {0.0f, 0.5f, -0.5f, 0.999f};
        auto bytes = wav::encode(std::span<const float>(f), 16000);
        auto audio = wav::decode(bytes);
        REQUIRE(audio.has_value());
        REQUIRE(audio->sample_rate == 16000);
        REQUIRE(audio->channels == 1);
        REQUIRE(audio->samples.size() == f.size());
        for (size_t i = 0; i < f.size(); ++i) {
            REQUIRE(std::fabs(audio->samples[i] - f[i]) <= 1.0f / 32767.0f);
        }
    }

    SECTION("StereoPcm16") {
        int16_t pcm[] = {32767, 0, -32767, 16384};
        auto bytes = build_wav(1, 2, 44100, 16, pcm, sizeof(pcm));
        auto audio = wav::decode(bytes);
        REQUIRE(audio.has_value());
        REQUIRE(audio->channels == 2);
        REQUIRE(audio->sample_rate == 44100);
        REQUIRE(audio->samples.size() == 4);
        REQUIRE(audio->samples[0] == 1.0f);
        REQUIRE(audio->samples[2] == -1.0f);
    }

    SECTION("Float32") {
        float data[] = {0.25f, -0.75f, 1.0f};
        auto bytes = build_wav(3, 1, 48000, 32, data, sizeof(data));
        auto audio = wav::decode(bytes);
        REQUIRE(audio.has_value());
        REQUIRE(audio->sample_rate == 48000);
        REQUIRE(audio->samples == std::vector<float>{0.25f, -0.75f, 1.0f});
    }

    SECTION("SkipsUnknownChunks") {
        int16_t pcm[] = {100, 200};
        auto bytes = build_wav(1, 1, 16000, 16, pcm, sizeof(pcm), true);
        auto audio = wav::decode(bytes);
        REQUIRE(audio.has_value());
        REQUIRE(audio->samples.size() == 2);
    }

    SECTION("TruncatedDataClamped") {
        int16_t pcm[] = {1, 2, 3, 4};
        auto bytes = build_wav(1, 1, 16000, 16, pcm, sizeof(pcm));
        bytes.resize(bytes.size() - 4);
        auto audio = wav::decode(bytes);
        REQUIRE(audio.has_value());
        REQUIRE(audio->samples.size() == 2);
    }

    SECTION("NotRiff") {
        std::vector<uint8_t> junk = {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '!'};
        auto audio = wav::decode(junk);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::Transcribe);
    }

    SECTION("TooShort") {
        std::vector<uint8_t> tiny = {'R', 'I', 'F', 'F'};
        REQUIRE_FALSE(wav::decode(tiny).has_value());
    }

    SECTION("UnsupportedEncoding") {
        uint8_t pcm8[] = {128, 255, 0, 64};
        auto bytes = build_wav(1, 1, 8000, 8, pcm8, sizeof(pcm8));
        auto audio = wav::decode(bytes);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().message.find("unsupported") != std::string::npos);
    }

    SECTION("MissingDataChunk") {
        int16_t pcm[] = {0};
        auto bytes = build_wav(1, 1, 16000, 16, pcm, sizeof(pcm));
        bytes.resize(12 + 8 + 16);
        REQUIRE_FALSE(wav::decode(bytes).has_value());
    }

    SECTION("ZeroChannels") {
        int16_t pcm[] = {0, 0};
        auto bytes = build_wav(1, 0, 16000, 16, pcm, sizeof(pcm));
        REQUIRE_FALSE(wav::decode(bytes).has_value());
    }
}
