#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

enum class ErrorKind { Device, Load, Inference, Transcribe, Config };

struct Error {
    ErrorKind kind = ErrorKind::Transcribe;
    std::string message;
    // Raw foreign status (HRESULT) when the failure came from the inference library.
    int32_t code = 0;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Device: return "device";
        case ErrorKind::Load: return "load";
        case ErrorKind::Inference: return "inference";
        case ErrorKind::Transcribe: return "transcribe";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

inline std::string describe(const Error& err) {
    return std::format("{} error: {}", to_string(err.kind), err.message);
}

inline Error device_error(std::string msg) { return {ErrorKind::Device, std::move(msg)}; }
inline Error load_error(std::string msg, int32_t code = 0) { return {ErrorKind::Load, std::move(msg), code}; }
inline Error transcribe_error(std::string msg) { return {ErrorKind::Transcribe, std::move(msg)}; }
inline Error config_error(std::string msg) { return {ErrorKind::Config, std::move(msg)}; }

inline Error inference_error(std::string_view what, int32_t hr) {
    return {ErrorKind::Inference,
            std::format("{} failed: HRESULT 0x{:08X}", what, static_cast<uint32_t>(hr)), hr};
}
