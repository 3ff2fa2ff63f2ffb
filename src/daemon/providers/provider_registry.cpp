#include "providers/provider_registry.hpp"

void ProviderRegistry::add(std::shared_ptr<SttProvider> provider) {
    std::lock_guard lock(mu_);
    for (auto& p : providers_) {
        if (p->id() == provider->id()) {
            p = std::move(provider);
            return;
        }
    }
    providers_.push_back(std::move(provider));
}

void ProviderRegistry::set_active(ProviderId id) {
    std::lock_guard lock(mu_);
    active_ = id;
}

ProviderId ProviderRegistry::active_id() const {
    std::lock_guard lock(mu_);
    return active_;
}

std::shared_ptr<SttProvider> ProviderRegistry::get_active() const {
    std::lock_guard lock(mu_);
    for (auto& p : providers_) {
        if (p->id() == active_) return p;
    }
    return providers_.empty() ? nullptr : providers_.front();
}

std::shared_ptr<SttProvider> ProviderRegistry::find(ProviderId id) const {
    std::lock_guard lock(mu_);
    for (auto& p : providers_) {
        if (p->id() == id) return p;
    }
    return nullptr;
}

std::vector<std::shared_ptr<SttProvider>> ProviderRegistry::snapshot() const {
    std::lock_guard lock(mu_);
    return providers_;
}

std::vector<ProviderInfo> ProviderRegistry::list() const {
    auto active = get_active();
    std::vector<ProviderInfo> out;
    // Availability may touch the filesystem; evaluate it unlocked.
    for (auto& p : snapshot()) {
        out.push_back({
            .id = p->id(),
            .name = std::string(p->name()),
            .available = p->is_available(),
            .active = p == active,
        });
    }
    return out;
}

void ProviderRegistry::configure_all(const Config& config) {
    for (auto& p : snapshot()) {
        p->configure(config);
    }
}
