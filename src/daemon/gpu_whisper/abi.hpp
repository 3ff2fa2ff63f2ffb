#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

// Binary interface of the GPU Whisper inference library (interface version 1.12).
//
// Every object the library hands out starts with a pointer to a function table.
// Slots 0, 1 and 2 of every table are QueryInterface, AddRef and Release; the
// object-specific slots follow in declaration order. Field order and sizes of
// every record below are part of the contract and must not change.
namespace gpu_whisper {

using HRESULT = int32_t;

constexpr HRESULT S_OK = 0;
constexpr HRESULT S_FALSE = 1;
constexpr HRESULT E_NOINTERFACE = static_cast<HRESULT>(0x80004002u);
constexpr HRESULT E_POINTER = static_cast<HRESULT>(0x80004003u);
constexpr HRESULT E_FAIL = static_cast<HRESULT>(0x80004005u);

inline bool failed(HRESULT hr) { return hr < 0; }

// The library's wide strings are UTF-16.
using wide_char = char16_t;

struct GUID {
    uint32_t data1;
    uint16_t data2;
    uint16_t data3;
    uint8_t data4[8];
};

// ---------------------------------------------------------------------------
// Model setup

enum class eModelImplementation : int32_t {
    GPU = 1,
    Hybrid = 2,
    Reference = 3,
};

namespace gpu_model_flags {
constexpr uint32_t Wave32 = 1;
constexpr uint32_t Wave64 = 2;
constexpr uint32_t UseReshapedMatMul = 4;
constexpr uint32_t NoReshapedMatMul = 8;
constexpr uint32_t Cloneable = 0x10;
} // namespace gpu_model_flags

struct sModelSetup {
    eModelImplementation impl = eModelImplementation::GPU;
    uint32_t flags = 0;
    const wide_char* adapter = nullptr; // null selects the default adapter
};

extern "C" {
using pfnLoadProgress = HRESULT (*)(double value, void* pv);
using pfnCancel = HRESULT (*)(void* pv);
using pfnNewSegment = HRESULT (*)(void* context, uint32_t n_new, void* user_data);
using pfnEncoderBegin = HRESULT (*)(void* context, void* user_data);
}

struct sLoadModelCallbacks {
    pfnLoadProgress progress = nullptr;
    pfnCancel cancel = nullptr;
    void* pv = nullptr;
};

// ---------------------------------------------------------------------------
// Transcription parameters

enum class eSamplingStrategy : int32_t {
    Greedy = 0,
    BeamSearch = 1,
};

namespace full_params_flags {
constexpr uint32_t Translate = 1;
constexpr uint32_t NoContext = 2;
constexpr uint32_t SingleSegment = 4;
constexpr uint32_t PrintSpecial = 8;
constexpr uint32_t PrintProgress = 0x10;
constexpr uint32_t PrintRealtime = 0x20;
constexpr uint32_t PrintTimestamps = 0x40;
constexpr uint32_t TokenTimestamps = 0x100;
constexpr uint32_t SpeedupAudio = 0x200;
} // namespace full_params_flags

struct sFullParams {
    eSamplingStrategy strategy;
    int32_t cpu_threads;
    int32_t n_max_text_ctx;
    int32_t offset_ms;
    int32_t duration_ms;
    uint32_t flags;
    uint32_t language;

    // Experimental timestamp parameters.
    float thold_pt;
    float thold_ptsum;
    int32_t max_len;
    int32_t max_tokens;

    struct {
        int32_t n_past;
    } greedy;

    struct {
        int32_t n_past;
        int32_t beam_width;
        int32_t n_best;
    } beam_search;

    int32_t audio_ctx;

    const int32_t* prompt_tokens;
    int32_t prompt_n_tokens;
    int32_t reserved; // alignment of the callback block on 64-bit targets

    pfnNewSegment new_segment_callback;
    void* new_segment_callback_user_data;
    pfnEncoderBegin encoder_begin_callback;
    void* encoder_begin_callback_user_data;
};

// Pack a 2-4 character ISO language code little-endian, one byte per character.
constexpr uint32_t make_language_key(std::string_view code) {
    uint32_t key = 0;
    size_t n = std::min<size_t>(code.size(), 4);
    for (size_t i = 0; i < n; ++i) {
        key |= static_cast<uint32_t>(static_cast<uint8_t>(code[i])) << (i * 8);
    }
    return key;
}

// ---------------------------------------------------------------------------
// Results

struct sTimeSpan {
    uint64_t ticks; // 100-nanosecond units
};

struct sTimeInterval {
    sTimeSpan begin;
    sTimeSpan end;
};

struct sSegment {
    const char* text;
    sTimeInterval time;
    uint32_t first_token;
    uint32_t count_tokens;
};

struct sTranscribeLength {
    uint32_t count_segments;
    uint32_t count_tokens;
};

namespace result_flags {
constexpr uint32_t None = 0;
constexpr uint32_t Timestamps = 1;
constexpr uint32_t Tokens = 2;
} // namespace result_flags

// ---------------------------------------------------------------------------
// Function tables

extern "C" {

struct IUnknownVtbl {
    HRESULT (*QueryInterface)(void* self, const GUID* iid, void** out);
    uint32_t (*AddRef)(void* self);
    uint32_t (*Release)(void* self);
};

struct IModelVtbl {
    HRESULT (*QueryInterface)(void* self, const GUID* iid, void** out);
    uint32_t (*AddRef)(void* self);
    uint32_t (*Release)(void* self);

    HRESULT (*createContext)(void* self, void** context);
    HRESULT (*tokenize)(void* self, const char* text, const void* callback, void* pv);
    HRESULT (*isMultilingual)(void* self);
    HRESULT (*getSpecialTokens)(void* self, void* tokens);
    const char* (*stringFromToken)(void* self, int32_t token);
    HRESULT (*clone)(void* self, void** model);
};

struct IContextVtbl {
    HRESULT (*QueryInterface)(void* self, const GUID* iid, void** out);
    uint32_t (*AddRef)(void* self);
    uint32_t (*Release)(void* self);

    HRESULT (*runFull)(void* self, const sFullParams* params, void* buffer);
    HRESULT (*runStreamed)(void* self, const sFullParams* params, const void* progress, void* reader);
    HRESULT (*runCapture)(void* self, const sFullParams* params, const void* callbacks, void* capture);
    HRESULT (*getResults)(void* self, uint32_t flags, void** result);
    HRESULT (*detectSpeaker)(void* self, const sTimeInterval* time, int32_t* speaker);
    HRESULT (*getModel)(void* self, void** model);
    HRESULT (*fullDefaultParams)(void* self, eSamplingStrategy strategy, sFullParams* params);
    HRESULT (*timingsPrint)(void* self);
    HRESULT (*timingsReset)(void* self);
};

struct ITranscribeResultVtbl {
    HRESULT (*QueryInterface)(void* self, const GUID* iid, void** out);
    uint32_t (*AddRef)(void* self);
    uint32_t (*Release)(void* self);

    HRESULT (*getSize)(void* self, sTranscribeLength* length);
    const sSegment* (*getSegments)(void* self);
    const void* (*getTokens)(void* self);
};

// Implemented on the host side, called by the library to pull PCM data.
struct IAudioBufferVtbl {
    HRESULT (*QueryInterface)(void* self, const GUID* iid, void** out);
    uint32_t (*AddRef)(void* self);
    uint32_t (*Release)(void* self);

    uint32_t (*countSamples)(const void* self);
    const float* (*getPcmMono)(const void* self);
    const float* (*getPcmStereo)(const void* self);
    HRESULT (*getTime)(const void* self, int64_t* time);
};

// Exported by the library.
using pfnLoadModel = HRESULT (*)(const wide_char* path, const sModelSetup* setup,
                                 const sLoadModelCallbacks* callbacks, void** model);

} // extern "C"

constexpr const char* kLoadModelExport = "loadModel";
// Whisper::loadModel(const char16_t*, const sModelSetup&, const sLoadModelCallbacks*, iModel**)
constexpr const char* kLoadModelMangledExport =
    "_ZN7Whisper9loadModelEPKDsRKNS_11sModelSetupEPKNS_19sLoadModelCallbacksEPPNS_6iModelE";

// Read the function table pointer stored in the first field of a foreign object.
template <typename Vtbl>
const Vtbl* vtable_of(void* object) {
    return *static_cast<const Vtbl* const*>(object);
}

#if UINTPTR_MAX == UINT64_MAX
static_assert(sizeof(sModelSetup) == 16);
static_assert(sizeof(sLoadModelCallbacks) == 24);
static_assert(offsetof(sFullParams, language) == 24);
static_assert(offsetof(sFullParams, audio_ctx) == 60);
static_assert(offsetof(sFullParams, prompt_tokens) == 64);
static_assert(offsetof(sFullParams, new_segment_callback) == 80);
static_assert(sizeof(sFullParams) == 112);
static_assert(sizeof(sSegment) == 32);
static_assert(sizeof(sTranscribeLength) == 8);
#endif

} // namespace gpu_whisper
