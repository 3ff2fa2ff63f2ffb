#include "gpu_whisper/model_store.hpp"

#include "platform/platform_paths.hpp"
#include "providers/http_client.hpp"

#include <array>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace gpu_whisper {

namespace {

constexpr std::array<ModelInfo, 3> kCatalog = {{
    {"Small", "ggml-small.bin",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-small.bin",
     "~466 MB - faster, lower accuracy"},
    {"Medium", "ggml-medium.bin",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-medium.bin",
     "~1.5 GB - recommended balance"},
    {"Large v3", "ggml-large-v3.bin",
     "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-large-v3.bin",
     "~3 GB - highest accuracy"},
}};

// Progress callbacks fire for every received chunk; report at most once per MiB.
constexpr uint64_t kProgressStep = 1024 * 1024;

} // namespace

std::span<const ModelInfo> model_catalog() {
    return kCatalog;
}

const ModelInfo* find_model(std::string_view filename) {
    for (auto& m : kCatalog) {
        if (m.filename == filename) return &m;
    }
    return nullptr;
}

fs::path ModelStore::default_dir() {
    return fs::path(platform::data_dir()) / "gpu-whisper";
}

std::string ModelStore::model_url(const ModelInfo& info) const {
    if (download_url_.empty()) return std::string(info.url);
    std::string base = download_url_;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return std::format("{}/{}", base, info.filename);
}

StoreStatus ModelStore::status() const {
    std::error_code ec;
    StoreStatus st{
        .directory = dir_.string(),
        .library_path = library_path().string(),
        .library_present = fs::exists(library_path(), ec),
    };
    for (auto& m : kCatalog) {
        st.models.push_back({.info = m, .present = fs::exists(model_path(m.filename), ec)});
    }
    return st;
}

std::expected<fs::path, Error>
ModelStore::download_model(std::string_view filename,
                           const std::function<void(const DownloadProgress&)>& progress,
                           std::stop_token stop) const {
    const ModelInfo* info = find_model(filename);
    if (!info) {
        return std::unexpected(config_error(std::format("unknown model: {}", filename)));
    }

    auto dest = model_path(info->filename);
    std::error_code ec;
    if (fs::exists(dest, ec)) return dest;

    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(transcribe_error(
            std::format("cannot create {}: {}", dir_.string(), ec.message())));
    }

    auto url = model_url(*info);
    std::println(stderr, "gpu-whisper: downloading {} from {}", info->name, url);

    auto temp = dest;
    temp += ".download";

    DownloadProgress state{.item = std::string(info->name)};
    uint64_t last_reported = 0;
    http::ProgressFn on_chunk = [&](uint64_t now, uint64_t total) {
        if (stop.stop_requested()) return false;
        state.downloaded_bytes = now;
        state.total_bytes = total;
        if (progress && now >= last_reported + kProgressStep) {
            last_reported = now;
            progress(state);
        }
        return true;
    };

    if (auto r = http::download(url, temp.string(), on_chunk); !r) {
        return std::unexpected(r.error());
    }

    fs::rename(temp, dest, ec);
    if (ec) {
        auto err = transcribe_error(
            std::format("failed to move downloaded file into place: {}", ec.message()));
        fs::remove(temp, ec);
        return std::unexpected(std::move(err));
    }

    state.done = true;
    if (progress) progress(state);

    std::println(stderr, "gpu-whisper: downloaded {} ({} bytes)", info->name, state.downloaded_bytes);
    return dest;
}

} // namespace gpu_whisper
