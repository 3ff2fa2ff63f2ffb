#pragma once

#include "gpu_whisper/abi.hpp"
#include "gpu_whisper/library.hpp"
#include "gpu_whisper/model_store.hpp"
#include "gpu_whisper/objects.hpp"
#include "providers/provider.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

// Settings that are baked into a loaded model; changing any of them forces a reload.
struct GpuLoaderSettings {
    std::string library_path; // empty = model store location
    std::string model_path;   // empty = model store location + model_name
    std::string model_name{gpu_whisper::kDefaultModelFilename};
    gpu_whisper::eModelImplementation implementation = gpu_whisper::eModelImplementation::GPU;
    uint32_t flags = 0;
    std::string adapter; // empty = default adapter

    bool operator==(const GpuLoaderSettings&) const = default;
};

// Settings read fresh for every call.
struct GpuCallSettings {
    gpu_whisper::eSamplingStrategy strategy = gpu_whisper::eSamplingStrategy::Greedy;
    int threads = 0; // 0 keeps the library default
};

GpuLoaderSettings gpu_loader_settings(const Config& config);
GpuCallSettings gpu_call_settings(const Config& config);

// Backend running Whisper inside an externally built GPU library.
//
// The library and model are loaded on first use and cached. The cache is
// handed out as a shared_ptr: a call takes its reference under the lock and
// releases the lock before any foreign call, so reconfiguring never waits for
// inference and an in-flight call keeps the model it started with.
//
// Two locks: settings_mu_ guards settings and the cache pointer and is never
// held across a foreign call; load_mu_ serializes loads. A load only installs
// its result if no reconfiguration happened while it ran.
class GpuWhisperProvider : public SttProvider {
public:
    struct LoadedState {
        // Declaration order matters: the model is released before the library is closed.
        gpu_whisper::WhisperLibrary library;
        gpu_whisper::Model model;
    };

    explicit GpuWhisperProvider(gpu_whisper::ModelStore store, GpuLoaderSettings settings = {});

    ProviderId id() const override { return ProviderId::GpuWhisper; }
    std::string_view name() const override { return "GPU Whisper (local)"; }

    // Both files present on disk; never loads anything.
    bool is_available() const override;

    std::expected<TranscriptionResult, Error>
        transcribe(std::span<const float> audio, const ProviderConfig& config) override;

    void configure(const Config& config) override;

    // Rebind library/model paths and drop the cached model.
    void update_paths(std::string library_path, std::string model_path);
    // Drops the cached model only when something that affects loading changed.
    void update_settings(GpuLoaderSettings settings);
    void set_call_settings(GpuCallSettings call);

    std::expected<std::shared_ptr<const LoadedState>, Error> ensure_loaded();
    bool is_loaded() const;

    std::filesystem::path resolved_library_path() const;
    std::filesystem::path resolved_model_path() const;

    const gpu_whisper::ModelStore& store() const { return store_; }

private:
    // Callers hold settings_mu_.
    std::filesystem::path library_path_locked() const;
    std::filesystem::path model_path_locked() const;
    std::shared_ptr<const LoadedState> invalidate_locked();

    std::mutex load_mu_;
    mutable std::mutex settings_mu_;
    gpu_whisper::ModelStore store_;
    GpuLoaderSettings settings_;
    GpuCallSettings call_;
    std::shared_ptr<const LoadedState> state_;
    uint64_t generation_ = 0;
};
