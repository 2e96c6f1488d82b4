#ifndef STRMATCH_PROFILE_H
#define STRMATCH_PROFILE_H

#include "allele_parser.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace strmatch {

inline constexpr const char* kDefaultIdColumn = "PersonID";

/**
 * SchemaError: structurally invalid input (missing identifier, wrong column
 * count). Malformed allele text is never a SchemaError.
 */
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * RawRecord: one profile as supplied by the driver layer
 * - key = column name, value = raw text
 * - an absent key and a nullopt value both mean "missing"
 */
struct RawRecord {
    std::unordered_map<std::string, std::optional<std::string>> fields;

    RawField get(const std::string& key) const;
    bool has(const std::string& key) const;
};

/**
 * QueryProfile: identifier plus pre-parsed alleles per locus.
 * Only loci supplied by the caller are stored.
 */
struct QueryProfile {
    std::string id;
    std::unordered_map<std::string, MaybeAlleles> loci;

    // nullptr if the locus was not supplied
    const MaybeAlleles* find(const std::string& locus) const;
};

// Throws SchemaError when the identifier is missing or empty.
QueryProfile make_query_profile(const RawRecord& record,
                                const std::string& id_column = kDefaultIdColumn);

/**
 * ProfileDatabase: immutable, pre-parsed candidate store
 *
 * - Schema = ordered locus names (identifier column excluded)
 * - Rows keep insertion order; a row's position is its scan index
 * - Cells are parsed once at load time so every query scan only compares
 *   numbers
 * - Read-only after loading; safe to share between concurrent scans
 */
class ProfileDatabase {
public:
    explicit ProfileDatabase(std::vector<std::string> loci,
                             std::string id_column = kDefaultIdColumn);

    // Fields aligned with loci(); throws SchemaError on empty id or size mismatch.
    void add_row(std::string id, const std::vector<std::optional<std::string>>& fields);

    // Throws SchemaError when the identifier is missing.
    void add_record(const RawRecord& record);

    void reserve(size_t rows);

    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    const std::vector<std::string>& loci() const { return loci_; }
    size_t num_loci() const { return loci_.size(); }
    const std::string& id_column() const { return id_column_; }

    const std::string& id(size_t row) const { return ids_[row]; }

    const MaybeAlleles& alleles(size_t row, size_t locus) const {
        return cells_[row * loci_.size() + locus];
    }

    std::optional<size_t> locus_index(const std::string& locus) const;

    // Query alleles laid out in schema order; loci the query lacks are absent.
    std::vector<MaybeAlleles> align(const QueryProfile& query) const;

    static ProfileDatabase from_records(std::vector<std::string> loci,
                                        const std::vector<RawRecord>& records,
                                        const std::string& id_column = kDefaultIdColumn);

private:
    std::vector<std::string> loci_;
    std::string id_column_;
    std::unordered_map<std::string, size_t> locus_lookup_;

    std::vector<std::string> ids_;
    std::vector<MaybeAlleles> cells_;  // row-major, size() * num_loci()
};

}  // namespace strmatch

#endif  // STRMATCH_PROFILE_H
