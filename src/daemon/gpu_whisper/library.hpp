#pragma once

#include "error.hpp"
#include "gpu_whisper/abi.hpp"
#include "gpu_whisper/objects.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace gpu_whisper {

// UTF-8 to null-terminated UTF-16. Invalid, overlong and surrogate sequences
// become U+FFFD.
std::u16string to_wide(std::string_view utf8);

// The inference library opened with dlopen, with its model factory resolved.
class WhisperLibrary {
public:
    static std::expected<WhisperLibrary, Error> open(const std::filesystem::path& path);

    ~WhisperLibrary();

    WhisperLibrary(const WhisperLibrary&) = delete;
    WhisperLibrary& operator=(const WhisperLibrary&) = delete;
    WhisperLibrary(WhisperLibrary&& other) noexcept;
    WhisperLibrary& operator=(WhisperLibrary&& other) noexcept;

    std::expected<Model, Error> load_model(const std::filesystem::path& model_path,
                                           const sModelSetup& setup) const;

    // Name of the export the factory was found under.
    const std::string& entry_point() const { return entry_point_; }

private:
    WhisperLibrary(void* handle, pfnLoadModel load_model, std::string entry_point)
        : handle_(handle), load_model_(load_model), entry_point_(std::move(entry_point)) {}

    void* handle_ = nullptr;
    pfnLoadModel load_model_ = nullptr;
    std::string entry_point_;
};

} // namespace gpu_whisper
