#include "events.hpp"

#include <memory>

std::string_view to_string(EventType type) {
    switch (type) {
        case EventType::RecordingStarted: return "recording-started";
        case EventType::RecordingStopped: return "recording-stopped";
        case EventType::Transcribing: return "transcribing";
        case EventType::TranscriptionComplete: return "transcription-complete";
        case EventType::Error: return "error";
        case EventType::DownloadProgress: return "download-progress";
        case EventType::DownloadComplete: return "download-complete";
    }
    return "unknown";
}

nlohmann::json Event::to_json() const {
    return {{"event", std::string(to_string(type))}, {"payload", payload}};
}

int EventBus::subscribe(Listener listener) {
    std::lock_guard lock(mu_);
    int id = next_id_++;
    listeners_.emplace_back(id, std::make_shared<Listener>(std::move(listener)));
    return id;
}

void EventBus::unsubscribe(int id) {
    std::lock_guard lock(mu_);
    std::erase_if(listeners_, [id](auto& entry) { return entry.first == id; });
}

void EventBus::publish(EventType type, nlohmann::json payload) {
    std::vector<std::shared_ptr<Listener>> targets;
    {
        std::lock_guard lock(mu_);
        for (auto& [id, l] : listeners_) targets.push_back(l);
    }

    Event ev{.type = type, .payload = std::move(payload)};
    for (auto& l : targets) {
        (*l)(ev);
    }
}
