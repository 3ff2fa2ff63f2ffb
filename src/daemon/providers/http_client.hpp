#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace http {

// Holds a reference on libcurl's global state for the owner's lifetime.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct FormField {
    std::string name;
    std::string value;
    std::string filename;     // set for file parts
    std::string content_type; // set for file parts
};

struct Response {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

std::expected<Response, Error> post_multipart(const std::string& url,
                                              const std::vector<FormField>& fields,
                                              const std::vector<std::string>& headers = {});

std::expected<Response, Error> post_json(const std::string& url, const std::string& body,
                                         const std::vector<std::string>& headers = {});

// (bytes received, total bytes or 0 when unknown). Return false to abort.
using ProgressFn = std::function<bool(uint64_t, uint64_t)>;

// Stream a GET response into dest. The file is removed on failure.
std::expected<void, Error> download(const std::string& url, const std::string& dest,
                                    const ProgressFn& progress);

std::string trim(std::string_view s);

std::string base64_encode(std::span<const uint8_t> data);

} // namespace http
