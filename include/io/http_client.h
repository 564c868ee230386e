#pragma once

#include <cstdint>
#include <string>

namespace statlas {
namespace io {

/// True for anything with a URL scheme ("https://", "file://", ...); plain paths are local
bool isUrl(const std::string& location);

/// "file:///tmp/x" -> "/tmp/x"; any other location is returned unchanged
std::string stripFileScheme(const std::string& location);

/// Joins with exactly one '/' between base and relative part
std::string joinPath(const std::string& base, const std::string& relative);

/**
 * @brief Blocking libcurl client for the handful of request shapes the catalog needs
 *
 * Every request uses its own easy handle, so one client may be shared by
 * concurrently running fetch tasks. Failures (transport errors, non-2xx
 * status codes) are raised as ResourceError.
 */
class HttpClient {
public:
    struct Options {
        long connect_timeout_seconds = 30;
        long timeout_seconds = 0;  // 0 = no overall timeout; rely on the transport
        std::string user_agent = "statlas/0.1";
    };

    HttpClient();
    explicit HttpClient(Options options);

    /// Whole body of a GET request
    std::string get(const std::string& url) const;

    /// Bytes [offset, offset + length) of the resource
    std::string getRange(const std::string& url, int64_t offset, int64_t length) const;

    /// Size announced by a HEAD request
    int64_t contentLength(const std::string& url) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

/**
 * @brief Read a whole text resource from a URL or a local path
 * @throws ResourceError
 */
std::string readText(const std::string& location, const HttpClient& client = HttpClient());

} // namespace io
} // namespace statlas
