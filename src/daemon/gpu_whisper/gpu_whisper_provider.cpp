#include "gpu_whisper/gpu_whisper_provider.hpp"

#include "gpu_whisper/host_audio_buffer.hpp"

#include <chrono>
#include <print>
#include <utility>

namespace fs = std::filesystem;
using namespace gpu_whisper;

GpuLoaderSettings gpu_loader_settings(const Config& config) {
    auto& g = config.gpu_whisper;
    GpuLoaderSettings s{
        .library_path = g.library_path,
        .model_path = g.model_path,
        .model_name = g.model_name.empty() ? std::string(kDefaultModelFilename) : g.model_name,
        .flags = g.flags,
        .adapter = g.adapter,
    };
    if (g.implementation == "hybrid") {
        s.implementation = eModelImplementation::Hybrid;
    } else if (g.implementation == "reference") {
        s.implementation = eModelImplementation::Reference;
    } else if (g.implementation != "gpu") {
        std::println(stderr, "gpu-whisper: unknown implementation '{}', using gpu", g.implementation);
    }
    return s;
}

GpuCallSettings gpu_call_settings(const Config& config) {
    auto& g = config.gpu_whisper;
    GpuCallSettings c{.threads = g.threads > 0 ? g.threads : 0};
    if (g.strategy == "beam") {
        c.strategy = eSamplingStrategy::BeamSearch;
    } else if (g.strategy != "greedy") {
        std::println(stderr, "gpu-whisper: unknown strategy '{}', using greedy", g.strategy);
    }
    return c;
}

GpuWhisperProvider::GpuWhisperProvider(ModelStore store, GpuLoaderSettings settings)
    : store_(std::move(store)), settings_(std::move(settings)) {}

fs::path GpuWhisperProvider::library_path_locked() const {
    if (!settings_.library_path.empty()) return settings_.library_path;
    return store_.library_path();
}

fs::path GpuWhisperProvider::model_path_locked() const {
    if (!settings_.model_path.empty()) return settings_.model_path;
    return store_.model_path(settings_.model_name);
}

fs::path GpuWhisperProvider::resolved_library_path() const {
    std::lock_guard lock(settings_mu_);
    return library_path_locked();
}

fs::path GpuWhisperProvider::resolved_model_path() const {
    std::lock_guard lock(settings_mu_);
    return model_path_locked();
}

bool GpuWhisperProvider::is_available() const {
    fs::path lib, model;
    {
        std::lock_guard lock(settings_mu_);
        lib = library_path_locked();
        model = model_path_locked();
    }
    std::error_code ec;
    return fs::exists(lib, ec) && fs::exists(model, ec);
}

bool GpuWhisperProvider::is_loaded() const {
    std::lock_guard lock(settings_mu_);
    return state_ != nullptr;
}

std::expected<std::shared_ptr<const GpuWhisperProvider::LoadedState>, Error>
GpuWhisperProvider::ensure_loaded() {
    std::lock_guard load_lock(load_mu_);

    GpuLoaderSettings settings;
    fs::path lib_path, model_path;
    uint64_t generation = 0;
    {
        std::lock_guard lock(settings_mu_);
        if (state_) return state_;
        settings = settings_;
        lib_path = library_path_locked();
        model_path = model_path_locked();
        generation = generation_;
    }

    std::println(stderr, "gpu-whisper: loading library {}", lib_path.string());
    auto library = WhisperLibrary::open(lib_path);
    if (!library) return std::unexpected(library.error());

    // The adapter string only has to live for the duration of the load call.
    std::u16string adapter = to_wide(settings.adapter);
    sModelSetup setup{
        .impl = settings.implementation,
        .flags = settings.flags,
        .adapter = settings.adapter.empty() ? nullptr : adapter.c_str(),
    };

    std::println(stderr, "gpu-whisper: loading model {} (via {})", model_path.string(),
                 library->entry_point());
    auto model = library->load_model(model_path, setup);
    if (!model) return std::unexpected(model.error());

    auto loaded = std::shared_ptr<const LoadedState>(std::make_shared<LoadedState>(
        LoadedState{std::move(*library), std::move(*model)}));

    std::lock_guard lock(settings_mu_);
    if (generation != generation_) {
        // Reconfigured mid-load: serve this call, but leave the cache empty.
        std::println(stderr, "gpu-whisper: settings changed during load, not caching");
        return loaded;
    }
    state_ = loaded;
    return loaded;
}

std::shared_ptr<const GpuWhisperProvider::LoadedState> GpuWhisperProvider::invalidate_locked() {
    ++generation_;
    return std::exchange(state_, nullptr);
}

void GpuWhisperProvider::update_paths(std::string library_path, std::string model_path) {
    std::shared_ptr<const LoadedState> old;
    {
        std::lock_guard lock(settings_mu_);
        old = invalidate_locked();
        settings_.library_path = std::move(library_path);
        settings_.model_path = std::move(model_path);
    }
    // Dropping old calls into the library, so it happens after unlocking.
}

void GpuWhisperProvider::update_settings(GpuLoaderSettings settings) {
    std::shared_ptr<const LoadedState> old;
    {
        std::lock_guard lock(settings_mu_);
        if (settings == settings_) return;
        old = invalidate_locked();
        settings_ = std::move(settings);
    }
}

void GpuWhisperProvider::set_call_settings(GpuCallSettings call) {
    std::lock_guard lock(settings_mu_);
    call_ = call;
}

void GpuWhisperProvider::configure(const Config& config) {
    update_settings(gpu_loader_settings(config));
    set_call_settings(gpu_call_settings(config));
}

std::expected<TranscriptionResult, Error>
GpuWhisperProvider::transcribe(std::span<const float> audio, const ProviderConfig& config) {
    if (audio.empty()) {
        return std::unexpected(transcribe_error("no audio captured"));
    }

    auto state = ensure_loaded();
    if (!state) return std::unexpected(state.error());

    GpuCallSettings call;
    {
        std::lock_guard lock(settings_mu_);
        call = call_;
    }

    // No lock is held from here on; *state keeps the model alive.
    const Model& model = (*state)->model;
    auto start = std::chrono::steady_clock::now();

    auto ctx = model.create_context();
    if (!ctx) return std::unexpected(ctx.error());

    auto params = ctx->default_params(call.strategy);
    if (!params) return std::unexpected(params.error());

    params->flags &= ~(full_params_flags::PrintProgress | full_params_flags::PrintRealtime |
                       full_params_flags::PrintTimestamps);
    if (call.threads > 0) {
        params->cpu_threads = call.threads;
    }
    if (!is_auto_language(config.language)) {
        if (!model.is_multilingual()) {
            std::println(stderr, "gpu-whisper: model is English-only, language '{}' may be ignored",
                         *config.language);
        }
        params->language = make_language_key(*config.language);
    }

    HostAudioBufferRef buffer(std::vector<float>(audio.begin(), audio.end()));
    if (auto r = ctx->run_full(*params, *buffer.get()); !r) {
        return std::unexpected(r.error());
    }

    auto result = ctx->results();
    if (!result) return std::unexpected(result.error());

    auto text = result->text();
    if (!text) return std::unexpected(text.error());

    // Drop the host reference now; the buffer is gone unless the library kept one.
    if (uint32_t left = buffer.reset(); left != 0) {
        std::println(stderr, "gpu-whisper: library still holds {} reference(s) to the audio buffer", left);
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    return TranscriptionResult{
        .text = std::move(*text),
        .provider = id(),
        .duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()),
        .language = config.language,
    };
}
