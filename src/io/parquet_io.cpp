#include "io/parquet_io.h"
#include "io/http_random_access_file.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>

namespace statlas {
namespace io {

using utils::throwIfError;
using utils::valueOrThrow;

namespace {

void collectLeaves(const parquet::arrow::SchemaField& field, std::vector<int>& out) {
    if (field.children.empty()) {
        out.push_back(field.column_index);
        return;
    }
    for (const auto& child : field.children) {
        collectLeaves(child, out);
    }
}

} // namespace

std::shared_ptr<arrow::io::RandomAccessFile> openInput(const std::string& location, const HttpClient& client) {
    if (isUrl(location)) {
        return valueOrThrow<ResourceError>(HttpRandomAccessFile::Open(location, client),
                                           "open '" + location + "'");
    }
    return valueOrThrow<ResourceError>(arrow::io::ReadableFile::Open(location), "open '" + location + "'");
}

std::unique_ptr<parquet::arrow::FileReader> openParquet(const std::string& location, const HttpClient& client) {
    auto input = openInput(location, client);

    parquet::ArrowReaderProperties arrow_props;
    // Coalesce the column chunk reads into few range requests
    arrow_props.set_pre_buffer(true);

    parquet::arrow::FileReaderBuilder builder;
    try {
        throwIfError<ResourceError>(builder.Open(input), "open parquet '" + location + "'");
    } catch (const parquet::ParquetException& e) {
        throw ResourceError("open parquet '" + location + "': " + e.what());
    }
    std::unique_ptr<parquet::arrow::FileReader> reader;
    throwIfError<ResourceError>(builder.properties(arrow_props)->Build(&reader),
                                "open parquet '" + location + "'");
    return reader;
}

std::shared_ptr<arrow::Table> readParquet(const std::string& location,
                                          const std::optional<std::vector<std::string>>& columns,
                                          const HttpClient& client) {
    STATLAS_DEBUG("Reading parquet {}", location);
    auto reader = openParquet(location, client);
    std::shared_ptr<arrow::Table> table;
    if (!columns) {
        throwIfError<ResourceError>(reader->ReadTable(&table), "read '" + location + "'");
        return table;
    }

    std::shared_ptr<arrow::Schema> schema;
    throwIfError<ResourceError>(reader->GetSchema(&schema), "read schema of '" + location + "'");
    const auto& manifest = reader->manifest();
    std::vector<int> leaves;
    for (const auto& name : *columns) {
        int idx = schema->GetFieldIndex(name);
        if (idx < 0) {
            throw ResourceError("column '" + name + "' not found in '" + location + "'");
        }
        collectLeaves(manifest.schema_fields[static_cast<size_t>(idx)], leaves);
    }
    throwIfError<ResourceError>(reader->ReadTable(leaves, &table), "read '" + location + "'");

    // ReadTable returns file order; restore the requested order
    std::vector<int> order;
    for (const auto& name : *columns) {
        order.push_back(table->schema()->GetFieldIndex(name));
    }
    return valueOrThrow(table->SelectColumns(order), "reorder columns");
}

void writeParquet(const arrow::Table& table, const std::string& path) {
    auto out = valueOrThrow<ResourceError>(arrow::io::FileOutputStream::Open(path), "create '" + path + "'");
    auto props = parquet::WriterProperties::Builder().compression(arrow::Compression::ZSTD)->build();
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    throwIfError<ResourceError>(
        parquet::arrow::WriteTable(table, arrow::default_memory_pool(), out,
                                   parquet::DEFAULT_MAX_ROW_GROUP_LENGTH, props, arrow_props),
        "write '" + path + "'");
    throwIfError<ResourceError>(out->Close(), "close '" + path + "'");
}

} // namespace io
} // namespace statlas
