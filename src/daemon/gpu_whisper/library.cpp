#include "gpu_whisper/library.hpp"

#include <dlfcn.h>
#include <format>
#include <utility>

namespace gpu_whisper {

std::u16string to_wide(std::string_view utf8) {
    std::u16string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        auto c = static_cast<uint8_t>(utf8[i]);
        uint32_t cp = 0xFFFD;
        size_t len = 1;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            out.push_back(u'\uFFFD');
            ++i;
            continue;
        }

        if (i + len > utf8.size()) {
            out.push_back(u'\uFFFD');
            break;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<uint8_t>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Smallest code point each sequence length may encode; anything below is overlong.
        static constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        if (!valid || cp < kMinForLength[len] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(u'\uFFFD');
            ++i;
            continue;
        }

        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
        i += len;
    }
    return out;
}

std::expected<WhisperLibrary, Error> WhisperLibrary::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(load_error(std::format("library not found at {}", path.string())));
    }

    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = ::dlerror();
        return std::unexpected(load_error(
            std::format("failed to load {}: {}", path.string(), err ? err : "unknown error")));
    }

    for (const char* name : {kLoadModelExport, kLoadModelMangledExport}) {
        ::dlerror();
        void* sym = ::dlsym(handle, name);
        if (sym) {
            return WhisperLibrary(handle, reinterpret_cast<pfnLoadModel>(sym), name);
        }
    }

    ::dlclose(handle);
    return std::unexpected(load_error(
        std::format("loadModel export not found in {}", path.string())));
}

WhisperLibrary::~WhisperLibrary() {
    if (handle_) {
        ::dlclose(handle_);
    }
}

WhisperLibrary::WhisperLibrary(WhisperLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)),
      load_model_(std::exchange(other.load_model_, nullptr)),
      entry_point_(std::move(other.entry_point_)) {}

WhisperLibrary& WhisperLibrary::operator=(WhisperLibrary&& other) noexcept {
    if (this != &other) {
        if (handle_) ::dlclose(handle_);
        handle_ = std::exchange(other.handle_, nullptr);
        load_model_ = std::exchange(other.load_model_, nullptr);
        entry_point_ = std::move(other.entry_point_);
    }
    return *this;
}

std::expected<Model, Error> WhisperLibrary::load_model(const std::filesystem::path& model_path,
                                                       const sModelSetup& setup) const {
    std::error_code ec;
    if (!std::filesystem::exists(model_path, ec)) {
        return std::unexpected(load_error(
            std::format("model file not found at {}", model_path.string())));
    }

    std::u16string wide_path = to_wide(model_path.string());
    void* raw = nullptr;
    HRESULT hr = load_model_(wide_path.c_str(), &setup, nullptr, &raw);
    ForeignPtr<IModelVtbl> model(raw);
    if (failed(hr)) {
        return std::unexpected(load_error(
            std::format("failed to load model {}: HRESULT 0x{:08X}",
                        model_path.string(), static_cast<uint32_t>(hr)), hr));
    }
    if (!model) {
        return std::unexpected(load_error("loadModel returned no model", E_POINTER));
    }
    return Model(std::move(model));
}

} // namespace gpu_whisper
