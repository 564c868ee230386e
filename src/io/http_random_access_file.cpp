#include "io/http_random_access_file.h"
#include "utils/errors.h"

#include <algorithm>
#include <cstring>

namespace statlas {
namespace io {

HttpRandomAccessFile::HttpRandomAccessFile(std::string url, HttpClient client)
    : url_(std::move(url)), client_(std::move(client)) {}

arrow::Result<std::shared_ptr<HttpRandomAccessFile>> HttpRandomAccessFile::Open(const std::string& url,
                                                                                HttpClient client) {
    auto file = std::make_shared<HttpRandomAccessFile>(url, std::move(client));
    ARROW_RETURN_NOT_OK(file->GetSize().status());
    return file;
}

arrow::Status HttpRandomAccessFile::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    return arrow::Status::OK();
}

bool HttpRandomAccessFile::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

arrow::Result<int64_t> HttpRandomAccessFile::Tell() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return arrow::Status::Invalid("Operation on closed file: ", url_);
    return position_;
}

arrow::Status HttpRandomAccessFile::Seek(int64_t position) {
    if (position < 0) {
        return arrow::Status::Invalid("Cannot seek to negative position ", position);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return arrow::Status::Invalid("Operation on closed file: ", url_);
    position_ = position;
    return arrow::Status::OK();
}

arrow::Result<int64_t> HttpRandomAccessFile::GetSize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_) return *size_;
    }
    int64_t size = 0;
    try {
        size = client_.contentLength(url_);
    } catch (const ResourceError& e) {
        return arrow::Status::IOError(e.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    size_ = size;
    return size;
}

arrow::Result<std::string> HttpRandomAccessFile::fetch(int64_t position, int64_t nbytes) {
    if (position < 0 || nbytes < 0) {
        return arrow::Status::Invalid("Invalid read range ", position, "+", nbytes, " on ", url_);
    }
    ARROW_ASSIGN_OR_RAISE(int64_t size, GetSize());
    const int64_t available = std::max<int64_t>(0, std::min(nbytes, size - position));
    if (available == 0) {
        return std::string();
    }
    try {
        return client_.getRange(url_, position, available);
    } catch (const ResourceError& e) {
        return arrow::Status::IOError(e.what());
    }
}

arrow::Result<int64_t> HttpRandomAccessFile::ReadAt(int64_t position, int64_t nbytes, void* out) {
    ARROW_ASSIGN_OR_RAISE(std::string data, fetch(position, nbytes));
    std::memcpy(out, data.data(), data.size());
    return static_cast<int64_t>(data.size());
}

arrow::Result<std::shared_ptr<arrow::Buffer>> HttpRandomAccessFile::ReadAt(int64_t position, int64_t nbytes) {
    ARROW_ASSIGN_OR_RAISE(std::string data, fetch(position, nbytes));
    return arrow::Buffer::FromString(std::move(data));
}

arrow::Result<int64_t> HttpRandomAccessFile::Read(int64_t nbytes, void* out) {
    ARROW_ASSIGN_OR_RAISE(int64_t pos, Tell());
    ARROW_ASSIGN_OR_RAISE(int64_t n, ReadAt(pos, nbytes, out));
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = pos + n;
    return n;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> HttpRandomAccessFile::Read(int64_t nbytes) {
    ARROW_ASSIGN_OR_RAISE(int64_t pos, Tell());
    ARROW_ASSIGN_OR_RAISE(auto buffer, ReadAt(pos, nbytes));
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = pos + buffer->size();
    return buffer;
}

} // namespace io
} // namespace statlas
