#pragma once

#include "output/output.hpp"

// Puts transcribed text on the Wayland clipboard via wl-copy.
class WaylandClipboardOutput : public OutputMethod {
public:
    std::string_view name() const override { return "wl-copy"; }
    std::expected<void, std::string> deliver(const std::string& text) override;
};
