#include "providers/provider_types.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<ProviderId, std::string_view>, 4> kProviderNames = {{
    {ProviderId::OpenAiWhisper, "openai_whisper"},
    {ProviderId::GoogleCloud, "google_cloud"},
    {ProviderId::LanWhisper, "lan_whisper"},
    {ProviderId::GpuWhisper, "gpu_whisper"},
}};

} // namespace

std::string_view to_string(ProviderId id) {
    for (auto& [pid, name] : kProviderNames) {
        if (pid == id) return name;
    }
    return "unknown";
}

std::optional<ProviderId> provider_id_from_string(std::string_view s) {
    for (auto& [pid, name] : kProviderNames) {
        if (name == s) return pid;
    }
    return std::nullopt;
}
