#pragma once

#include "io/http_client.h"

#include <arrow/api.h>
#include <arrow/io/interfaces.h>
#include <parquet/arrow/reader.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statlas {
namespace io {

/**
 * @brief Random-access input for a location
 *
 * Plain paths open as local files; URLs (http, https, file) go through
 * HttpRandomAccessFile so only the requested byte ranges are transferred.
 * @throws ResourceError
 */
std::shared_ptr<arrow::io::RandomAccessFile> openInput(const std::string& location,
                                                       const HttpClient& client = HttpClient());

/// @throws ResourceError if the location is unreachable or not a Parquet file
std::unique_ptr<parquet::arrow::FileReader> openParquet(const std::string& location,
                                                        const HttpClient& client = HttpClient());

/**
 * @brief Read a Parquet file, optionally only the named top-level columns
 *
 * Columns come back in the requested order.
 * @throws ResourceError on I/O failure or if a requested column is absent
 */
std::shared_ptr<arrow::Table> readParquet(const std::string& location,
                                          const std::optional<std::vector<std::string>>& columns = std::nullopt,
                                          const HttpClient& client = HttpClient());

/**
 * @brief Write a table as ZSTD-compressed Parquet, keeping the Arrow schema
 * @throws ResourceError
 */
void writeParquet(const arrow::Table& table, const std::string& path);

} // namespace io
} // namespace statlas
