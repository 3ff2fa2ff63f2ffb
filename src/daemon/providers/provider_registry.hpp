#pragma once

#include "providers/provider.hpp"

#include <memory>
#include <mutex>
#include <vector>

struct ProviderInfo {
    ProviderId id;
    std::string name;
    bool available = false;
    bool active = false;
};

// One instance per backend id. The active id changes only through set_active().
// Lookups hand out shared_ptrs so callers can keep a backend across a long
// transcription without holding the registry lock.
class ProviderRegistry {
public:
    void add(std::shared_ptr<SttProvider> provider);

    void set_active(ProviderId id);
    ProviderId active_id() const;

    // Falls back to the first registered backend when the active id is unknown.
    std::shared_ptr<SttProvider> get_active() const;
    std::shared_ptr<SttProvider> find(ProviderId id) const;

    std::vector<ProviderInfo> list() const;

    void configure_all(const Config& config);

private:
    std::vector<std::shared_ptr<SttProvider>> snapshot() const;

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<SttProvider>> providers_;
    ProviderId active_ = ProviderId::OpenAiWhisper;
};
