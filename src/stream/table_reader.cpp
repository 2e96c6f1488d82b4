#include "table_reader.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace strmatch {
namespace {

// pandas read_csv default na_values
constexpr std::array<std::string_view, 18> kMissingTokens = {
    "NA", "N/A", "n/a", "NaN", "nan", "-NaN", "-nan", "null", "NULL",
    "<NA>", "#N/A", "#N/A N/A", "#NA", "None",
    "1.#IND", "1.#QNAN", "-1.#IND", "-1.#QNAN"
};

class HtslibTableStreamReader final : public TableStreamReader {
public:
    HtslibTableStreamReader(std::string path, const TableReaderOptions& options)
        : path_(std::move(path)), options_(options) {
        file_ = hts_open(path_.c_str(), "r");
        if (!file_) {
            std::cerr << "[TableReader] failed to open table: " << path_ << '\n';
            return;
        }

        const htsFormat* format = hts_get_format(file_);
        if (options_.decompression_threads > 1 && format != nullptr &&
            format->compression == bgzf) {
            if (hts_set_threads(file_, options_.decompression_threads) != 0) {
                std::cerr << "[TableReader] could not start decompression threads for "
                          << path_ << ", reading single-threaded\n";
            }
        }

        if (!read_header()) {
            std::cerr << "[TableReader] failed to read table header: " << path_ << '\n';
            return;
        }

        valid_ = true;
    }

    ~HtslibTableStreamReader() override {
        free(line_.s);
        if (file_ != nullptr) {
            hts_close(file_);
        }
    }

    HtslibTableStreamReader(const HtslibTableStreamReader&) = delete;
    HtslibTableStreamReader& operator=(const HtslibTableStreamReader&) = delete;

    bool is_valid() const override { return valid_; }
    const std::string& path() const override { return path_; }
    const std::vector<std::string>& header() const override { return header_; }
    int64_t malformed_rows() const override { return malformed_; }

    int64_t stream(
        const RowHandler& row_handler,
        const TableProgressHandler& progress_handler,
        int64_t progress_interval) override {
        if (!valid_ || !row_handler) {
            return -1;
        }

        int64_t processed = 0;
        int64_t last_progress = 0;
        std::vector<std::string> fields;

        while (true) {
            const int rc = next_line();
            if (rc == -1) break;
            if (rc < -1) {
                std::cerr << "[TableReader] read error in " << path_
                          << " at line " << line_no_ << '\n';
                return -1;
            }

            const std::string_view line = current_line();
            if (line.empty()) continue;

            const bool quoted_ok = split_delimited_line(line, options_.delimiter, fields);
            if (!quoted_ok || fields.size() != header_.size()) {
                report_malformed(quoted_ok
                    ? "expected " + std::to_string(header_.size()) + " columns, found " +
                      std::to_string(fields.size())
                    : std::string("unterminated quote"));
                continue;
            }

            row_handler(line_no_, to_table_row(std::move(fields)));
            fields.clear();
            ++processed;

            if (progress_handler && progress_interval > 0 &&
                processed - last_progress >= progress_interval) {
                if (!progress_handler(processed)) {
                    break;
                }
                last_progress = processed;
            }
        }

        if (progress_handler) {
            progress_handler(processed);
        }

        if (malformed_ > options_.max_warnings) {
            std::cerr << "[TableReader] " << path_ << ": " << malformed_
                      << " malformed rows skipped in total\n";
        }

        return processed;
    }

private:
    int next_line() {
        const int rc = hts_getline(file_, KS_SEP_LINE, &line_);
        if (rc >= 0) ++line_no_;
        return rc;
    }

    std::string_view current_line() const {
        std::string_view line(line_.s, line_.l);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        return line;
    }

    bool read_header() {
        while (true) {
            const int rc = next_line();
            if (rc < 0) return false;

            std::string_view line = current_line();
            if (line.empty()) continue;

            // UTF-8 BOM
            if (line.size() >= 3 && line.substr(0, 3) == "\xEF\xBB\xBF") {
                line.remove_prefix(3);
            }

            std::vector<std::string> names;
            if (!split_delimited_line(line, options_.delimiter, names)) return false;
            for (auto& name : names) {
                header_.emplace_back(trim_field(name));
            }
            return !header_.empty();
        }
    }

    void report_malformed(const std::string& what) {
        ++malformed_;
        const std::string message =
            path_ + ":" + std::to_string(line_no_) + ": malformed row, " + what;
        if (options_.strict) {
            throw SchemaError(message);
        }
        if (malformed_ <= options_.max_warnings) {
            std::cerr << "[TableReader] " << message << ", skipped\n";
        }
    }

    std::string path_;
    TableReaderOptions options_;
    htsFile* file_ = nullptr;
    kstring_t line_ = {0, 0, nullptr};
    std::vector<std::string> header_;
    int64_t line_no_ = 0;
    int64_t malformed_ = 0;
    bool valid_ = false;
};

std::unique_ptr<TableStreamReader> open_or_throw(const std::string& path,
                                                 const TableReaderOptions& options) {
    auto reader = make_table_reader(path, options);
    if (!reader->is_valid()) {
        throw std::runtime_error("Cannot read table: " + path);
    }
    return reader;
}

TableProgressHandler make_progress_logger(const std::string& label,
                                          const TableReaderOptions& options,
                                          std::chrono::steady_clock::time_point start) {
    if (!options.verbose) return nullptr;
    return [label, start](int64_t processed) -> bool {
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "[TableReader] " << label << ": " << processed
                  << " rows (" << elapsed << " s)" << std::endl;
        return true;
    };
}

}  // namespace

std::unique_ptr<TableStreamReader> make_table_reader(
    const std::string& path,
    const TableReaderOptions& options) {
    return std::make_unique<HtslibTableStreamReader>(path, options);
}

bool split_delimited_line(std::string_view line, char delimiter,
                          std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == delimiter) {
            fields.push_back(std::move(field));
            field.clear();
            field_quoted = false;
        } else if (c == '"' && !field_quoted && trim_field(field).empty()) {
            field.clear();
            in_quotes = true;
            field_quoted = true;
        } else {
            field.push_back(c);
        }
    }

    if (in_quotes) return false;
    fields.push_back(std::move(field));
    return true;
}

bool is_missing_token(std::string_view text) {
    text = trim_field(text);
    if (text.empty()) return true;
    return std::find(kMissingTokens.begin(), kMissingTokens.end(), text) != kMissingTokens.end();
}

TableRow to_table_row(std::vector<std::string>&& fields) {
    TableRow row;
    row.reserve(fields.size());
    for (auto& field : fields) {
        if (is_missing_token(field)) {
            row.emplace_back(std::nullopt);
        } else {
            row.emplace_back(std::move(field));
        }
    }
    return row;
}

ProfileDatabase load_profile_database(const std::string& path,
                                      const TableReaderOptions& options,
                                      const std::string& id_column,
                                      LoadStats* stats) {
    const auto start = std::chrono::steady_clock::now();
    auto reader = open_or_throw(path, options);

    const auto& header = reader->header();
    auto id_it = std::find(header.begin(), header.end(), id_column);
    if (id_it == header.end()) {
        throw SchemaError("database " + path + " has no '" + id_column + "' column");
    }
    const size_t id_idx = static_cast<size_t>(id_it - header.begin());

    ProfileDatabase db(header, id_column);

    int64_t skipped = 0;
    std::vector<std::optional<std::string>> loci_fields;
    loci_fields.reserve(db.num_loci());

    const int64_t rows = reader->stream(
        [&](int64_t line_no, TableRow&& row) {
            loci_fields.clear();
            for (size_t i = 0; i < row.size(); ++i) {
                if (i != id_idx) loci_fields.push_back(std::move(row[i]));
            }
            try {
                db.add_row(row[id_idx].value_or(std::string()), loci_fields);
            } catch (const SchemaError& e) {
                if (options.strict) throw;
                ++skipped;
                if (skipped <= options.max_warnings) {
                    std::cerr << "[TableReader] " << path << ":" << line_no
                              << ": " << e.what() << ", skipped\n";
                }
            }
        },
        make_progress_logger("database", options, start),
        options.progress_interval);

    if (rows < 0) {
        throw std::runtime_error("Failed while reading database: " + path);
    }
    if (skipped > options.max_warnings) {
        std::cerr << "[TableReader] " << path << ": " << skipped
                  << " rows without a usable identifier skipped in total\n";
    }

    if (stats) {
        stats->rows = static_cast<int64_t>(db.size());
        stats->skipped = skipped + reader->malformed_rows();
        stats->elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    }
    return db;
}

std::vector<RawRecord> load_query_records(const std::string& path,
                                          const TableReaderOptions& options,
                                          LoadStats* stats) {
    const auto start = std::chrono::steady_clock::now();
    auto reader = open_or_throw(path, options);
    const auto& header = reader->header();

    std::vector<RawRecord> records;
    const int64_t rows = reader->stream(
        [&](int64_t, TableRow&& row) {
            RawRecord record;
            for (size_t i = 0; i < row.size(); ++i) {
                record.fields[header[i]] = std::move(row[i]);
            }
            records.push_back(std::move(record));
        },
        make_progress_logger("queries", options, start),
        options.progress_interval);

    if (rows < 0) {
        throw std::runtime_error("Failed while reading queries: " + path);
    }

    if (stats) {
        stats->rows = static_cast<int64_t>(records.size());
        stats->skipped = reader->malformed_rows();
        stats->elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    }
    return records;
}

}  // namespace strmatch
