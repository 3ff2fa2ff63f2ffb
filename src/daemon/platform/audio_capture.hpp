#pragma once

#include "error.hpp"

#include <expected>
#include <string>
#include <vector>

struct InputDevice {
    std::string name;        // stable identifier, used to select the device
    std::string description; // human-readable
    bool is_default = false;
};

class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    virtual std::vector<InputDevice> list_devices() = 0;

    // Empty device name selects the system default. An unknown name falls
    // back to the default with a warning.
    virtual std::expected<void, Error> start(const std::string& device) = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
