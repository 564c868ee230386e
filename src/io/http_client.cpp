#include "io/http_client.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <curl/curl.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

namespace statlas {
namespace io {

namespace {

std::once_flag g_curl_init;

void ensureCurlInitialized() {
    std::call_once(g_curl_init, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            STATLAS_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle newHandle(const std::string& url, const HttpClient::Options& opts) {
    ensureCurlInitialized();
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw ResourceError("failed to initialize CURL for '" + url + "'");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_seconds);
    if (opts.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, opts.timeout_seconds);
    }
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opts.user_agent.c_str());
    return curl;
}

// file:// transfers report status 0; http(s) must answer 2xx
void performChecked(CURL* curl, const std::string& url) {
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw ResourceError("fetch of '" + url + "' failed: " + curl_easy_strerror(res));
    }
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 0 && (http_code < 200 || http_code >= 300)) {
        throw ResourceError("fetch of '" + url + "' failed: HTTP " + std::to_string(http_code));
    }
}

} // namespace

bool isUrl(const std::string& location) {
    return location.find("://") != std::string::npos;
}

std::string stripFileScheme(const std::string& location) {
    static const std::string kFileScheme = "file://";
    if (location.compare(0, kFileScheme.size(), kFileScheme) == 0) {
        return location.substr(kFileScheme.size());
    }
    return location;
}

std::string joinPath(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    const bool base_slash = base.back() == '/';
    const bool rel_slash = relative.front() == '/';
    if (base_slash && rel_slash) return base + relative.substr(1);
    if (base_slash || rel_slash) return base + relative;
    return base + "/" + relative;
}

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

std::string HttpClient::get(const std::string& url) const {
    auto curl = newHandle(url, options_);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    STATLAS_DEBUG("GET {}", url);
    performChecked(curl.get(), url);
    return body;
}

std::string HttpClient::getRange(const std::string& url, int64_t offset, int64_t length) const {
    if (length <= 0) {
        return {};
    }
    auto curl = newHandle(url, options_);
    std::string body;
    const std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    STATLAS_TRACE("GET {} bytes={}", url, range);
    performChecked(curl.get(), url);

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 200 && static_cast<int64_t>(body.size()) > length) {
        // Server ignored the Range header and sent the whole resource
        if (offset >= static_cast<int64_t>(body.size())) {
            return {};
        }
        return body.substr(static_cast<size_t>(offset), static_cast<size_t>(length));
    }
    return body;
}

int64_t HttpClient::contentLength(const std::string& url) const {
    if (url.rfind("file://", 0) == 0) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(stripFileScheme(url), ec);
        if (ec) {
            throw ResourceError("cannot stat '" + url + "': " + ec.message());
        }
        return static_cast<int64_t>(size);
    }
    auto curl = newHandle(url, options_);
    std::string ignored;
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ignored);
    STATLAS_DEBUG("HEAD {}", url);
    performChecked(curl.get(), url);
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        throw ResourceError("server did not report a size for '" + url + "'");
    }
    return static_cast<int64_t>(length);
}

std::string readText(const std::string& location, const HttpClient& client) {
    if (isUrl(location) && location.rfind("file://", 0) != 0) {
        return client.get(location);
    }
    const std::string path = stripFileScheme(location);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw ResourceError("failed to read file '" + path + "'");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace io
} // namespace statlas
