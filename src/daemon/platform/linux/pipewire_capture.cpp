#include "platform/linux/pipewire_capture.hpp"

#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <pipewire/extensions/metadata.h>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// One-shot registry walk: collects Audio/Source nodes and the "default"
// metadata entry, then stops after a core sync round-trip.
struct DeviceScan {
    pw_thread_loop* loop = nullptr;
    pw_core* core = nullptr;
    pw_registry* registry = nullptr;
    pw_metadata* metadata = nullptr;

    spa_hook core_listener{};
    spa_hook registry_listener{};
    spa_hook metadata_listener{};

    std::vector<InputDevice> devices;
    std::string default_name;

    int pending = 0;
    bool metadata_synced = false;
    bool done = false;
};

const char* lookup(const spa_dict* props, const char* key) {
    return props ? spa_dict_lookup(props, key) : nullptr;
}

// default.audio.source is stored as {"name": "<node.name>"}
std::string parse_default_node(const char* value) {
    if (!value) return {};
    try {
        auto j = nlohmann::json::parse(value);
        if (j.contains("name") && j["name"].is_string()) return j["name"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "audio: bad default source metadata: {}", e.what());
    }
    return {};
}

int on_metadata_property(void* data, uint32_t /*subject*/, const char* key,
                         const char* /*type*/, const char* value) {
    auto* scan = static_cast<DeviceScan*>(data);
    if (key && std::strcmp(key, "default.audio.source") == 0) {
        scan->default_name = parse_default_node(value);
    }
    return 0;
}

constexpr pw_metadata_events metadata_events = {
    .version = PW_VERSION_METADATA_EVENTS,
    .property = on_metadata_property,
};

void on_registry_global(void* data, uint32_t id, uint32_t /*permissions*/,
                        const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* scan = static_cast<DeviceScan*>(data);
    if (!type) return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        const char* media_class = lookup(props, PW_KEY_MEDIA_CLASS);
        const char* name = lookup(props, PW_KEY_NODE_NAME);
        if (!media_class || !name || std::strcmp(media_class, "Audio/Source") != 0) return;

        const char* desc = lookup(props, PW_KEY_NODE_DESCRIPTION);
        if (!desc) desc = lookup(props, PW_KEY_NODE_NICK);
        scan->devices.push_back({.name = name, .description = desc ? desc : name});
        return;
    }

    if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0 && !scan->metadata) {
        const char* meta_name = lookup(props, PW_KEY_METADATA_NAME);
        if (!meta_name || std::strcmp(meta_name, "default") != 0) return;

        scan->metadata = static_cast<pw_metadata*>(
            pw_registry_bind(scan->registry, id, type, PW_VERSION_METADATA, 0));
        if (scan->metadata) {
            pw_metadata_add_listener(scan->metadata, &scan->metadata_listener,
                                     &metadata_events, scan);
        }
    }
}

constexpr pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

void on_core_done(void* data, uint32_t id, int seq) {
    auto* scan = static_cast<DeviceScan*>(data);
    if (id != PW_ID_CORE || seq != scan->pending) return;

    // Metadata properties arrive after the bind, so a second round-trip is
    // needed once the default metadata object has been found.
    if (scan->metadata && !scan->metadata_synced) {
        scan->metadata_synced = true;
        scan->pending = pw_core_sync(scan->core, PW_ID_CORE, scan->pending);
        return;
    }
    scan->done = true;
    pw_thread_loop_signal(scan->loop, false);
}

constexpr pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
};

std::vector<InputDevice> scan_devices() {
    DeviceScan scan;
    scan.loop = pw_thread_loop_new("voxpaste-scan", nullptr);
    if (!scan.loop) {
        std::println(stderr, "audio: failed to create scan loop");
        return {};
    }

    if (pw_thread_loop_start(scan.loop) < 0) {
        std::println(stderr, "audio: failed to start scan loop");
        pw_thread_loop_destroy(scan.loop);
        return {};
    }

    pw_thread_loop_lock(scan.loop);

    auto* context = pw_context_new(pw_thread_loop_get_loop(scan.loop), nullptr, 0);
    if (context) scan.core = pw_context_connect(context, nullptr, 0);

    if (!scan.core) {
        std::println(stderr, "audio: failed to connect to PipeWire");
    } else {
        pw_core_add_listener(scan.core, &scan.core_listener, &core_events, &scan);
        scan.registry = pw_core_get_registry(scan.core, PW_VERSION_REGISTRY, 0);
        pw_registry_add_listener(scan.registry, &scan.registry_listener,
                                 &registry_events, &scan);
        scan.pending = pw_core_sync(scan.core, PW_ID_CORE, 0);

        while (!scan.done) {
            if (pw_thread_loop_timed_wait(scan.loop, 2) != 0) {
                std::println(stderr, "audio: timed out enumerating devices");
                break;
            }
        }

        if (scan.metadata) {
            spa_hook_remove(&scan.metadata_listener);
            pw_proxy_destroy(reinterpret_cast<pw_proxy*>(scan.metadata));
        }
        spa_hook_remove(&scan.registry_listener);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(scan.registry));
        spa_hook_remove(&scan.core_listener);
        pw_core_disconnect(scan.core);
    }
    if (context) pw_context_destroy(context);

    pw_thread_loop_unlock(scan.loop);
    pw_thread_loop_stop(scan.loop);
    pw_thread_loop_destroy(scan.loop);

    for (auto& dev : scan.devices) {
        dev.is_default = !scan.default_name.empty() && dev.name == scan.default_name;
    }
    return std::move(scan.devices);
}

} // namespace

PipeWireCapture::PipeWireCapture(CaptureBuffer& buffer) : buffer_(buffer) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::vector<InputDevice> PipeWireCapture::list_devices() {
    return scan_devices();
}

std::expected<void, Error> PipeWireCapture::start(const std::string& device) {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    auto devices = list_devices();
    if (devices.empty()) {
        return std::unexpected(device_error("no input device available"));
    }

    std::string target;
    if (!device.empty()) {
        bool found = false;
        for (auto& d : devices) {
            if (d.name == device) found = true;
        }
        if (found) {
            target = device;
        } else {
            std::println(stderr, "audio: input device '{}' not found, using default", device);
        }
    }

    loop_ = pw_thread_loop_new("voxpaste", nullptr);
    if (!loop_) {
        return std::unexpected(device_error("failed to create PipeWire thread loop"));
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "voxpaste",
        PW_KEY_APP_NAME, "voxpaste",
        nullptr
    );
    if (!target.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "voxpaste-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected(device_error("failed to create PipeWire stream"));
    }

    // Offer float and 16-bit integer without rate or channels, so the
    // device's native layout is negotiated and reported in param_changed.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto f32 = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_F32);
    auto s16 = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_S16);
    const spa_pod* params[2];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &f32);
    params[1] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &s16);

    sample_format_.store(SPA_AUDIO_FORMAT_UNKNOWN, std::memory_order_relaxed);
    buffer_.reset();

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 2
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(device_error(
            std::format("stream connect failed: {}", spa_strerror(ret))));
    }

    // on_process drops buffers until this is set, so set it before the loop runs.
    capturing_.store(true, std::memory_order_release);
    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(device_error(
            std::format("thread loop start failed: {}", spa_strerror(ret))));
    }
    return {};
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_param_changed(void* userdata, uint32_t id, const spa_pod* param) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!param || id != SPA_PARAM_Format) return;

    uint32_t media_type = 0, media_subtype = 0;
    if (spa_format_parse(param, &media_type, &media_subtype) < 0) return;
    if (media_type != SPA_MEDIA_TYPE_audio || media_subtype != SPA_MEDIA_SUBTYPE_raw) return;

    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) return;

    self->buffer_.set_format(info.rate, static_cast<uint16_t>(info.channels));
    self->sample_format_.store(info.format, std::memory_order_release);
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        switch (self->sample_format_.load(std::memory_order_acquire)) {
            case SPA_AUDIO_FORMAT_F32:
                self->buffer_.append(std::span(reinterpret_cast<const float*>(data),
                                               size / sizeof(float)));
                break;
            case SPA_AUDIO_FORMAT_S16:
                self->buffer_.append_pcm16(std::span(reinterpret_cast<const int16_t*>(data),
                                                     size / sizeof(int16_t)));
                break;
            default:
                break;
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
