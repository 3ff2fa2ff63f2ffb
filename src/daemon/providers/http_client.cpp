#include "providers/http_client.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <filesystem>
#include <memory>

namespace http {

namespace {

constexpr long kTimeoutSeconds = 120;
constexpr long kConnectTimeoutSeconds = 10;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<FILE*>(userdata)) * size;
}

int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* fn = static_cast<const ProgressFn*>(userdata);
    if (*fn && !(*fn)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal))) {
        return 1; // non-zero aborts the transfer
    }
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

SlistHandle make_headers(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    return SlistHandle(list);
}

std::expected<Response, Error> perform(CURL* curl, const std::string& url) {
    Response resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(transcribe_error(std::string("curl error: ") + curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

std::expected<Response, Error> post_multipart(const std::string& url,
                                              const std::vector<FormField>& fields,
                                              const std::vector<std::string>& headers) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(transcribe_error("curl_easy_init failed"));
    }

    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
    for (auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, f.name.c_str());
        curl_mime_data(part, f.value.data(), f.value.size());
        if (!f.filename.empty()) curl_mime_filename(part, f.filename.c_str());
        if (!f.content_type.empty()) curl_mime_type(part, f.content_type.c_str());
    }

    auto header_list = make_headers(headers);
    if (header_list) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

    return perform(curl.get(), url);
}

std::expected<Response, Error> post_json(const std::string& url, const std::string& body,
                                         const std::vector<std::string>& headers) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(transcribe_error("curl_easy_init failed"));
    }

    auto all_headers = headers;
    all_headers.push_back("Content-Type: application/json");
    auto header_list = make_headers(all_headers);

    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    return perform(curl.get(), url);
}

std::expected<void, Error> download(const std::string& url, const std::string& dest,
                                    const ProgressFn& progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(transcribe_error("curl_easy_init failed"));
    }

    FILE* out = std::fopen(dest.c_str(), "wb");
    if (!out) {
        return std::unexpected(transcribe_error("cannot create " + dest));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl.get());
    bool closed = std::fclose(out) == 0;

    if (res != CURLE_OK || !closed) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        if (res != CURLE_OK) {
            return std::unexpected(transcribe_error(std::string("download failed: ") + curl_easy_strerror(res)));
        }
        return std::unexpected(transcribe_error("failed to write " + dest));
    }
    return {};
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::string base64_encode(std::span<const uint8_t> data) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += kAlphabet[(v >> 6) & 0x3F];
        out += kAlphabet[v & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t v = uint32_t(data[i]) << 16;
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += kAlphabet[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace http
