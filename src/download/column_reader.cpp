#include "download/column_reader.h"
#include "catalog/column_names.h"
#include "io/parquet_io.h"
#include "storage/table_ops.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <arrow/compute/api.h>
#include <tbb/task_group.h>

#include <algorithm>
#include <sstream>

namespace statlas {
namespace download {

namespace cp = arrow::compute;
using utils::throwIfError;
using utils::valueOrThrow;

namespace {

std::string quoteIdent(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    return out + "\"";
}

std::string quoteLiteral(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "''";
        else out += c;
    }
    return out + "'";
}

std::string singleFileSelect(const std::string& file, const std::vector<std::string>& columns,
                             const std::optional<KeySet>& keys) {
    std::ostringstream sql;
    sql << "SELECT " << quoteIdent(col::GEO_ID);
    for (const auto& c : columns) {
        sql << ", " << quoteIdent(c);
    }
    sql << " FROM read_parquet(" << quoteLiteral(file) << ")";
    if (keys) {
        if (keys->empty()) {
            sql << " WHERE FALSE";
        } else {
            sql << " WHERE " << quoteIdent(col::GEO_ID) << " IN (";
            for (size_t i = 0; i < keys->size(); ++i) {
                if (i) sql << ", ";
                sql << quoteLiteral((*keys)[i]);
            }
            sql << ")";
        }
    }
    return sql.str();
}

cp::Expression keyFilter(const KeySet& keys) {
    arrow::StringBuilder builder;
    throwIfError(builder.AppendValues(keys), "build key set");
    auto value_set = valueOrThrow(builder.Finish(), "build key set");
    return cp::call("is_in", {cp::field_ref(col::GEO_ID)}, cp::SetLookupOptions(value_set));
}

} // namespace

std::vector<std::pair<std::string, std::vector<std::string>>> groupByFile(const std::vector<MetricRequest>& requests) {
    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    for (const auto& r : requests) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&r](const auto& g) { return g.first == r.metric_file; });
        if (it == groups.end()) {
            groups.push_back({r.metric_file, {r.column}});
        } else if (std::find(it->second.begin(), it->second.end(), r.column) == it->second.end()) {
            it->second.push_back(r.column);
        }
    }
    return groups;
}

std::shared_ptr<arrow::Table> fetchColumns(const std::string& url, const std::vector<std::string>& columns,
                                           const std::optional<KeySet>& keys, const io::HttpClient& client) {
    std::vector<std::string> wanted;
    for (const auto& c : columns) {
        if (c != col::GEO_ID) wanted.push_back(c);
    }
    wanted.push_back(col::GEO_ID);

    STATLAS_DEBUG("Fetching {} column(s) from {}", wanted.size() - 1, url);
    auto table = io::readParquet(url, wanted, client);
    if (keys) {
        table = storage::filter(table, keyFilter(*keys));
    }
    return table;
}

std::shared_ptr<arrow::Table> fetchMetrics(const std::vector<MetricRequest>& requests,
                                           const std::optional<KeySet>& keys, const io::HttpClient& client) {
    const auto groups = groupByFile(requests);
    if (groups.empty()) {
        throw ShapeError("no metric requests to fetch");
    }

    std::vector<std::shared_ptr<arrow::Table>> tables(groups.size());
    tbb::task_group tg;
    for (size_t i = 0; i < groups.size(); ++i) {
        tg.run([&, i]() {
            tables[i] = fetchColumns(groups[i].first, groups[i].second, keys, client);
        });
    }
    tg.wait();

    auto joined = tables.front();
    for (size_t i = 1; i < tables.size(); ++i) {
        joined = storage::innerJoin(joined, tables[i], col::GEO_ID, col::GEO_ID);
    }
    return storage::moveColumnFirst(joined, col::GEO_ID);
}

std::string toSqlText(const std::vector<MetricRequest>& requests, const std::optional<KeySet>& keys) {
    const auto groups = groupByFile(requests);
    if (groups.empty()) {
        throw ShapeError("no metric requests to translate");
    }
    if (groups.size() == 1) {
        return singleFileSelect(groups[0].first, groups[0].second, keys);
    }

    std::ostringstream sql;
    sql << "SELECT q0." << quoteIdent(col::GEO_ID);
    for (size_t i = 0; i < groups.size(); ++i) {
        for (const auto& c : groups[i].second) {
            sql << ", q" << i << "." << quoteIdent(c);
        }
    }
    for (size_t i = 0; i < groups.size(); ++i) {
        sql << (i == 0 ? " FROM (" : " JOIN (")
            << singleFileSelect(groups[i].first, groups[i].second, keys)
            << ") AS q" << i;
        if (i > 0) {
            sql << " USING (" << col::GEO_ID << ")";
        }
    }
    return sql.str();
}

} // namespace download
} // namespace statlas
