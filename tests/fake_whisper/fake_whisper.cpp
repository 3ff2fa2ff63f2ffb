// Stand-in for the GPU inference library: exports a model factory and
// implements the model / context / result function tables in-process.

#include "fake_whisper.hpp"

#include "gpu_whisper/abi.hpp"

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <string>
#include <vector>

using namespace gpu_whisper;

namespace {

std::mutex g_mu;
std::condition_variable g_cv;
FakeWhisperStats g_stats{};
int32_t g_mode = FAKE_WHISPER_OK;
bool g_hold_audio = false;
bool g_multilingual = true;
bool g_block_run = false;
bool g_run_released = false;
bool g_block_load = false;
bool g_load_released = false;

void bump(int32_t FakeWhisperStats::*field, int32_t delta) {
    std::lock_guard lock(g_mu);
    g_stats.*field += delta;
}

HRESULT no_interface(void*, const GUID*, void** out) {
    if (out) *out = nullptr;
    return E_NOINTERFACE;
}

// ---------------------------------------------------------------------------

struct FakeModel {
    const IModelVtbl* vtbl;
    std::atomic<uint32_t> refs{1};
};

struct FakeResult {
    const ITranscribeResultVtbl* vtbl;
    std::atomic<uint32_t> refs{1};
    std::vector<std::string> texts;
    std::vector<sSegment> segments;
};

struct FakeContext {
    const IContextVtbl* vtbl;
    std::atomic<uint32_t> refs{1};
    FakeModel* model;
    void* held_audio = nullptr;
    std::string transcript;
};

uint32_t model_add_ref(void* self) {
    return ++static_cast<FakeModel*>(self)->refs;
}

uint32_t model_release(void* self) {
    auto* m = static_cast<FakeModel*>(self);
    uint32_t left = --m->refs;
    if (left == 0) {
        delete m;
        bump(&FakeWhisperStats::live_models, -1);
    }
    return left;
}

// ---------------------------------------------------------------------------

uint32_t result_add_ref(void* self) {
    return ++static_cast<FakeResult*>(self)->refs;
}

uint32_t result_release(void* self) {
    auto* r = static_cast<FakeResult*>(self);
    uint32_t left = --r->refs;
    if (left == 0) {
        delete r;
        bump(&FakeWhisperStats::live_results, -1);
    }
    return left;
}

HRESULT result_get_size(void* self, sTranscribeLength* len) {
    auto* r = static_cast<FakeResult*>(self);
    len->count_segments = static_cast<uint32_t>(r->segments.size());
    len->count_tokens = 0;
    return S_OK;
}

const sSegment* result_get_segments(void* self) {
    auto* r = static_cast<FakeResult*>(self);
    return r->segments.empty() ? nullptr : r->segments.data();
}

const void* result_get_tokens(void*) {
    return nullptr;
}

constexpr ITranscribeResultVtbl kResultVtbl = {
    .QueryInterface = no_interface,
    .AddRef = result_add_ref,
    .Release = result_release,
    .getSize = result_get_size,
    .getSegments = result_get_segments,
    .getTokens = result_get_tokens,
};

// ---------------------------------------------------------------------------

uint32_t context_add_ref(void* self) {
    return ++static_cast<FakeContext*>(self)->refs;
}

uint32_t context_release(void* self) {
    auto* c = static_cast<FakeContext*>(self);
    uint32_t left = --c->refs;
    if (left == 0) {
        if (c->held_audio) {
            vtable_of<IAudioBufferVtbl>(c->held_audio)->Release(c->held_audio);
        }
        model_release(c->model);
        delete c;
        bump(&FakeWhisperStats::live_contexts, -1);
    }
    return left;
}

HRESULT context_run_full(void* self, const sFullParams* params, void* buffer) {
    auto* c = static_cast<FakeContext*>(self);
    auto* audio = vtable_of<IAudioBufferVtbl>(buffer);

    // Like the real library: hold a reference for the duration of the run.
    uint32_t refs = audio->AddRef(buffer);

    uint32_t count = audio->countSamples(buffer);
    const float* pcm = audio->getPcmMono(buffer);
    float sum = 0.0f;
    for (uint32_t i = 0; pcm && i < count; ++i) sum += pcm[i];

    {
        std::unique_lock lock(g_mu);
        g_stats.run_calls++;
        g_stats.last_strategy = static_cast<int32_t>(params->strategy);
        g_stats.last_threads = params->cpu_threads;
        g_stats.last_flags = params->flags;
        g_stats.last_language = params->language;
        g_stats.last_sample_count = count;
        g_stats.last_sample_sum = sum;
        g_stats.audio_refs_during_run = refs;

        if (g_block_run) {
            g_cv.wait(lock, [] { return g_run_released; });
        }
    }

    bool fail = false;
    {
        std::lock_guard lock(g_mu);
        fail = g_mode == FAKE_WHISPER_FAIL_RUN;
        if (g_hold_audio && !c->held_audio) {
            audio->AddRef(buffer);
            c->held_audio = buffer;
        }
    }
    audio->Release(buffer);

    if (fail) return E_FAIL;

    c->transcript = std::format("{} samples", count);
    return S_OK;
}

HRESULT context_get_results(void* self, uint32_t, void** out) {
    auto* c = static_cast<FakeContext*>(self);
    {
        std::lock_guard lock(g_mu);
        if (g_mode == FAKE_WHISPER_FAIL_RESULTS) {
            *out = nullptr;
            return E_FAIL;
        }
        g_stats.live_results++;
    }

    auto* r = new FakeResult{.vtbl = &kResultVtbl};
    r->texts = {"  transcript of", " " + c->transcript + " \n"};
    for (auto& t : r->texts) {
        r->segments.push_back(sSegment{.text = t.c_str(), .time = {}, .first_token = 0, .count_tokens = 0});
    }
    *out = r;
    return S_OK;
}

HRESULT context_default_params(void*, eSamplingStrategy strategy, sFullParams* p) {
    p->strategy = strategy;
    p->cpu_threads = 4;
    p->n_max_text_ctx = 16384;
    p->flags = full_params_flags::PrintProgress | full_params_flags::PrintRealtime |
               full_params_flags::PrintTimestamps | full_params_flags::TokenTimestamps;
    p->language = make_language_key("en");
    p->thold_pt = 0.01f;
    p->thold_ptsum = 0.01f;
    p->greedy.n_past = 0;
    p->beam_search.beam_width = 5;
    return S_OK;
}

HRESULT context_not_implemented_streamed(void*, const sFullParams*, const void*, void*) {
    return E_FAIL;
}

HRESULT context_not_implemented_detect(void*, const sTimeInterval*, int32_t*) {
    return E_FAIL;
}

HRESULT context_get_model(void* self, void** model) {
    auto* c = static_cast<FakeContext*>(self);
    model_add_ref(c->model);
    *model = c->model;
    return S_OK;
}

HRESULT context_timings(void*) {
    return S_OK;
}

constexpr IContextVtbl kContextVtbl = {
    .QueryInterface = no_interface,
    .AddRef = context_add_ref,
    .Release = context_release,
    .runFull = context_run_full,
    .runStreamed = context_not_implemented_streamed,
    .runCapture = context_not_implemented_streamed,
    .getResults = context_get_results,
    .detectSpeaker = context_not_implemented_detect,
    .getModel = context_get_model,
    .fullDefaultParams = context_default_params,
    .timingsPrint = context_timings,
    .timingsReset = context_timings,
};

// ---------------------------------------------------------------------------

HRESULT model_create_context(void* self, void** out) {
    {
        std::lock_guard lock(g_mu);
        if (g_mode == FAKE_WHISPER_FAIL_CREATE_CONTEXT) {
            *out = nullptr;
            return E_FAIL;
        }
        g_stats.live_contexts++;
    }
    auto* m = static_cast<FakeModel*>(self);
    model_add_ref(m);
    *out = new FakeContext{.vtbl = &kContextVtbl, .model = m};
    return S_OK;
}

HRESULT model_tokenize(void*, const char*, const void*, void*) {
    return E_FAIL;
}

HRESULT model_is_multilingual(void*) {
    std::lock_guard lock(g_mu);
    return g_multilingual ? S_OK : S_FALSE;
}

HRESULT model_special_tokens(void*, void*) {
    return E_FAIL;
}

const char* model_string_from_token(void*, int32_t) {
    return nullptr;
}

HRESULT model_clone(void*, void** out) {
    *out = nullptr;
    return E_FAIL;
}

constexpr IModelVtbl kModelVtbl = {
    .QueryInterface = no_interface,
    .AddRef = model_add_ref,
    .Release = model_release,
    .createContext = model_create_context,
    .tokenize = model_tokenize,
    .isMultilingual = model_is_multilingual,
    .getSpecialTokens = model_special_tokens,
    .stringFromToken = model_string_from_token,
    .clone = model_clone,
};

[[maybe_unused]] HRESULT load_model_impl(const wide_char* path, const sModelSetup* setup, void** model) {
    std::unique_lock lock(g_mu);
    g_stats.load_calls++;
    g_stats.last_impl = static_cast<int32_t>(setup->impl);
    g_stats.last_setup_flags = setup->flags;
    g_stats.last_adapter_set = setup->adapter != nullptr;

    size_t i = 0;
    for (; path && path[i] && i + 1 < sizeof(g_stats.last_model_path); ++i) {
        g_stats.last_model_path[i] = path[i] < 0x80 ? static_cast<char>(path[i]) : '?';
    }
    g_stats.last_model_path[i] = '\0';

    if (g_block_load) {
        g_stats.load_waiting = 1;
        g_cv.wait(lock, [] { return g_load_released; });
        g_stats.load_waiting = 0;
    }

    if (g_mode == FAKE_WHISPER_FAIL_LOAD) {
        *model = nullptr;
        return E_FAIL;
    }

    g_stats.live_models++;
    *model = new FakeModel{.vtbl = &kModelVtbl};
    return S_OK;
}

} // namespace

#if defined(FAKE_WHISPER_MANGLED_EXPORT)

// Exported under its C++ name only, as some builds of the library ship it.
namespace Whisper {

struct sModelSetup;
struct sLoadModelCallbacks;
struct iModel;

__attribute__((visibility("default")))
gpu_whisper::HRESULT loadModel(const char16_t* path, const sModelSetup& setup,
                               const sLoadModelCallbacks*, iModel** model) {
    return load_model_impl(path, reinterpret_cast<const gpu_whisper::sModelSetup*>(&setup),
                           reinterpret_cast<void**>(model));
}

} // namespace Whisper

#elif !defined(FAKE_WHISPER_NO_FACTORY)

extern "C" __attribute__((visibility("default")))
HRESULT loadModel(const wide_char* path, const sModelSetup* setup,
                  const sLoadModelCallbacks*, void** model) {
    return load_model_impl(path, setup, model);
}

#endif

extern "C" {

__attribute__((visibility("default")))
void fake_whisper_reset() {
    std::lock_guard lock(g_mu);
    int32_t live_models = g_stats.live_models;
    int32_t live_contexts = g_stats.live_contexts;
    int32_t live_results = g_stats.live_results;
    g_stats = FakeWhisperStats{};
    // Objects still alive from an earlier test stay counted.
    g_stats.live_models = live_models;
    g_stats.live_contexts = live_contexts;
    g_stats.live_results = live_results;
    g_mode = FAKE_WHISPER_OK;
    g_hold_audio = false;
    g_multilingual = true;
    g_block_run = false;
    g_run_released = false;
    g_block_load = false;
    g_load_released = false;
}

__attribute__((visibility("default")))
void fake_whisper_set_mode(int32_t mode) {
    std::lock_guard lock(g_mu);
    g_mode = mode;
}

__attribute__((visibility("default")))
void fake_whisper_set_hold_audio(int32_t hold) {
    std::lock_guard lock(g_mu);
    g_hold_audio = hold != 0;
}

__attribute__((visibility("default")))
void fake_whisper_set_multilingual(int32_t multilingual) {
    std::lock_guard lock(g_mu);
    g_multilingual = multilingual != 0;
}

__attribute__((visibility("default")))
void fake_whisper_set_block_run(int32_t block) {
    std::lock_guard lock(g_mu);
    g_block_run = block != 0;
    g_run_released = false;
}

__attribute__((visibility("default")))
void fake_whisper_release_run() {
    {
        std::lock_guard lock(g_mu);
        g_run_released = true;
    }
    g_cv.notify_all();
}

__attribute__((visibility("default")))
void fake_whisper_set_block_load(int32_t block) {
    std::lock_guard lock(g_mu);
    g_block_load = block != 0;
    g_load_released = false;
}

__attribute__((visibility("default")))
void fake_whisper_release_load() {
    {
        std::lock_guard lock(g_mu);
        g_load_released = true;
    }
    g_cv.notify_all();
}

__attribute__((visibility("default")))
void fake_whisper_stats(FakeWhisperStats* out) {
    std::lock_guard lock(g_mu);
    *out = g_stats;
}

} // extern "C"
