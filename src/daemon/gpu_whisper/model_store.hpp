#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace gpu_whisper {

inline constexpr std::string_view kLibraryFilename = "libWhisper.so";
inline constexpr std::string_view kDefaultModelFilename = "ggml-medium.bin";

struct ModelInfo {
    std::string_view name;
    std::string_view filename;
    std::string_view url;
    std::string_view size_description;
};

std::span<const ModelInfo> model_catalog();
const ModelInfo* find_model(std::string_view filename);

struct DownloadProgress {
    std::string item;
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0; // 0 when the server did not say
    bool done = false;
};

struct StoreStatus {
    std::string directory;
    std::string library_path;
    bool library_present = false;

    struct Entry {
        ModelInfo info;
        bool present = false;
    };
    std::vector<Entry> models;
};

// Well-known location for the inference library and downloaded models.
class ModelStore {
public:
    // A non-empty download_url replaces the catalog host: models are fetched
    // from <download_url>/<filename>.
    explicit ModelStore(std::filesystem::path dir, std::string download_url = {})
        : dir_(std::move(dir)), download_url_(std::move(download_url)) {}

    // <data_dir>/gpu-whisper
    static std::filesystem::path default_dir();

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path library_path() const { return dir_ / kLibraryFilename; }
    std::filesystem::path model_path(std::string_view filename) const { return dir_ / filename; }
    std::string model_url(const ModelInfo& info) const;

    StoreStatus status() const;

    // Fetches a catalog model into <file>.download, then renames it into place.
    // Already-present models are not fetched again. A stop request aborts
    // the transfer and removes the partial file.
    std::expected<std::filesystem::path, Error>
        download_model(std::string_view filename,
                       const std::function<void(const DownloadProgress&)>& progress,
                       std::stop_token stop = {}) const;

private:
    std::filesystem::path dir_;
    std::string download_url_;
};

} // namespace gpu_whisper
