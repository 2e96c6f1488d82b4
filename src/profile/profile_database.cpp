#include "profile.h"

#include <utility>

namespace strmatch {

// ============================================================================
// RawRecord / QueryProfile
// ============================================================================

RawField RawRecord::get(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end() || !it->second) return std::nullopt;
    return std::string_view(*it->second);
}

bool RawRecord::has(const std::string& key) const {
    return fields.find(key) != fields.end();
}

const MaybeAlleles* QueryProfile::find(const std::string& locus) const {
    auto it = loci.find(locus);
    return it == loci.end() ? nullptr : &it->second;
}

QueryProfile make_query_profile(const RawRecord& record, const std::string& id_column) {
    const RawField id = record.get(id_column);
    if (!id || trim_field(*id).empty()) {
        throw SchemaError("query profile has no '" + id_column + "' identifier");
    }

    QueryProfile query;
    query.id = std::string(trim_field(*id));
    for (const auto& [key, value] : record.fields) {
        if (key == id_column) continue;
        query.loci.emplace(key, parse_alleles(value ? RawField(*value) : std::nullopt));
    }
    return query;
}

// ============================================================================
// ProfileDatabase
// ============================================================================

ProfileDatabase::ProfileDatabase(std::vector<std::string> loci, std::string id_column)
    : id_column_(std::move(id_column)) {
    loci_.reserve(loci.size());
    for (auto& locus : loci) {
        if (locus == id_column_) continue;
        if (locus_lookup_.count(locus) != 0) {
            throw SchemaError("duplicate locus column: " + locus);
        }
        locus_lookup_.emplace(locus, loci_.size());
        loci_.push_back(std::move(locus));
    }
}

void ProfileDatabase::add_row(std::string id,
                              const std::vector<std::optional<std::string>>& fields) {
    const std::string_view trimmed = trim_field(id);
    if (trimmed.empty()) {
        throw SchemaError("candidate row " + std::to_string(ids_.size()) +
                          " has no '" + id_column_ + "' identifier");
    }
    if (fields.size() != loci_.size()) {
        throw SchemaError("candidate '" + std::string(trimmed) + "' has " +
                          std::to_string(fields.size()) + " locus fields, schema has " +
                          std::to_string(loci_.size()));
    }

    for (const auto& field : fields) {
        cells_.push_back(parse_alleles(field ? RawField(*field) : std::nullopt));
    }
    ids_.emplace_back(trimmed);
}

void ProfileDatabase::add_record(const RawRecord& record) {
    const RawField id = record.get(id_column_);
    if (!id) {
        throw SchemaError("candidate row " + std::to_string(ids_.size()) +
                          " has no '" + id_column_ + "' identifier");
    }

    std::vector<std::optional<std::string>> fields;
    fields.reserve(loci_.size());
    for (const auto& locus : loci_) {
        const RawField value = record.get(locus);
        fields.push_back(value ? std::optional<std::string>(std::string(*value)) : std::nullopt);
    }
    add_row(std::string(*id), fields);
}

void ProfileDatabase::reserve(size_t rows) {
    ids_.reserve(rows);
    cells_.reserve(rows * loci_.size());
}

std::optional<size_t> ProfileDatabase::locus_index(const std::string& locus) const {
    auto it = locus_lookup_.find(locus);
    if (it == locus_lookup_.end()) return std::nullopt;
    return it->second;
}

std::vector<MaybeAlleles> ProfileDatabase::align(const QueryProfile& query) const {
    std::vector<MaybeAlleles> aligned(loci_.size());
    for (size_t i = 0; i < loci_.size(); ++i) {
        const MaybeAlleles* alleles = query.find(loci_[i]);
        if (alleles != nullptr) aligned[i] = *alleles;
    }
    return aligned;
}

ProfileDatabase ProfileDatabase::from_records(std::vector<std::string> loci,
                                              const std::vector<RawRecord>& records,
                                              const std::string& id_column) {
    ProfileDatabase db(std::move(loci), id_column);
    db.reserve(records.size());
    for (const auto& record : records) {
        db.add_record(record);
    }
    return db;
}

}  // namespace strmatch
