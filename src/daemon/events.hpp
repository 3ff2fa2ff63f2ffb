#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

enum class EventType {
    RecordingStarted,
    RecordingStopped,
    Transcribing,
    TranscriptionComplete,
    Error,
    DownloadProgress,
    DownloadComplete,
};

std::string_view to_string(EventType type);

struct Event {
    EventType type;
    nlohmann::json payload;

    // {"event": "<name>", "payload": ...}
    nlohmann::json to_json() const;
};

// Lifecycle notifications for observers. publish() may be called from any
// thread; listeners run on the publishing thread, outside the bus lock.
class EventBus {
public:
    using Listener = std::function<void(const Event&)>;

    int subscribe(Listener listener);
    void unsubscribe(int id);

    void publish(EventType type, nlohmann::json payload = nullptr);

private:
    std::mutex mu_;
    int next_id_ = 1;
    std::vector<std::pair<int, std::shared_ptr<Listener>>> listeners_;
};
