#ifndef STRMATCH_TABLE_READER_H
#define STRMATCH_TABLE_READER_H

#include "profile.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strmatch {

struct TableReaderOptions {
    char delimiter = ',';
    int32_t decompression_threads = 2;  // bgzip input only
    bool strict = false;                // malformed row -> SchemaError instead of skip
    bool verbose = true;                // progress lines; warnings always go to stderr
    int64_t progress_interval = 100000;
    int32_t max_warnings = 10;          // per file, then only counted
};

// One data row aligned with the header; nullopt = missing-data marker.
using TableRow = std::vector<std::optional<std::string>>;

using RowHandler = std::function<void(int64_t line_no, TableRow&& row)>;
using TableProgressHandler = std::function<bool(int64_t processed)>;

/**
 * TableStreamReader: delimited profile table, one row at a time
 * - First non-empty line is the header
 * - Rows with a bad column count or an unterminated quote are malformed:
 *   skipped with a warning, or SchemaError in strict mode
 */
class TableStreamReader {
public:
    virtual ~TableStreamReader() = default;

    virtual bool is_valid() const = 0;
    virtual const std::string& path() const = 0;
    virtual const std::vector<std::string>& header() const = 0;
    virtual int64_t malformed_rows() const = 0;

    // Returns rows delivered, or -1 on read error.
    virtual int64_t stream(
        const RowHandler& row_handler,
        const TableProgressHandler& progress_handler = nullptr,
        int64_t progress_interval = 100000) = 0;
};

// Plain, gzip and bgzip files are all accepted.
std::unique_ptr<TableStreamReader> make_table_reader(
    const std::string& path,
    const TableReaderOptions& options = {});

/**
 * Split one line on `delimiter`, honouring double quotes ("9,9.3", "a""b").
 * Returns false on an unterminated quote.
 */
bool split_delimited_line(std::string_view line, char delimiter,
                          std::vector<std::string>& fields);

// Empty text and the usual NA spellings (NA, NaN, null, <NA>, ...).
bool is_missing_token(std::string_view text);

TableRow to_table_row(std::vector<std::string>&& fields);

struct LoadStats {
    int64_t rows = 0;
    int64_t skipped = 0;
    double elapsed_seconds = 0.0;
};

/**
 * Load the candidate database. Every header column except `id_column` is a
 * locus. Throws std::runtime_error if the file cannot be read and
 * SchemaError if the identifier column is missing.
 */
ProfileDatabase load_profile_database(const std::string& path,
                                      const TableReaderOptions& options,
                                      const std::string& id_column = kDefaultIdColumn,
                                      LoadStats* stats = nullptr);

/**
 * Load query rows as raw records. Rows lacking an identifier are kept; the
 * batch runner reports them per query.
 */
std::vector<RawRecord> load_query_records(const std::string& path,
                                          const TableReaderOptions& options,
                                          LoadStats* stats = nullptr);

}  // namespace strmatch

#endif  // STRMATCH_TABLE_READER_H
