#pragma once

#include "io/http_client.h"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace statlas {
namespace io {

/**
 * @brief arrow::io::RandomAccessFile over HTTP range requests
 *
 * Lets the Parquet reader fetch only the footer and the column chunks it
 * needs instead of downloading the whole file. ReadAt is stateless and may be
 * called concurrently; Read/Seek share one cursor.
 */
class HttpRandomAccessFile : public arrow::io::RandomAccessFile {
public:
    HttpRandomAccessFile(std::string url, HttpClient client);

    /// Opens and reads the size with a HEAD request
    static arrow::Result<std::shared_ptr<HttpRandomAccessFile>> Open(const std::string& url,
                                                                     HttpClient client = HttpClient());

    arrow::Status Close() override;
    bool closed() const override;

    arrow::Result<int64_t> Tell() const override;
    arrow::Status Seek(int64_t position) override;

    arrow::Result<int64_t> Read(int64_t nbytes, void* out) override;
    arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

    arrow::Result<int64_t> ReadAt(int64_t position, int64_t nbytes, void* out) override;
    arrow::Result<std::shared_ptr<arrow::Buffer>> ReadAt(int64_t position, int64_t nbytes) override;

    arrow::Result<int64_t> GetSize() override;

    const std::string& url() const { return url_; }

private:
    arrow::Result<std::string> fetch(int64_t position, int64_t nbytes);

    std::string url_;
    HttpClient client_;
    mutable std::mutex mutex_;
    std::optional<int64_t> size_;
    int64_t position_ = 0;
    bool closed_ = false;
};

} // namespace io
} // namespace statlas
