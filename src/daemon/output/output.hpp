#pragma once

#include <expected>
#include <string>
#include <string_view>

// Where a finished transcription goes when output.auto_paste is set.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;

    virtual std::string_view name() const = 0;

    // Errors are reported as text; a failed delivery never fails the transcription.
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
