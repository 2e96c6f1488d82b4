#ifndef STRMATCH_CANDIDATE_INDEX_H
#define STRMATCH_CANDIDATE_INDEX_H

#include "profile.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace strmatch {

/**
 * CandidateIndex: per-locus inverted index  allele -> database rows
 *
 * Used as a prefilter only. candidates_for() returns every row that shares
 * an allele with the query, or has one a single repeat step away, at one or
 * more loci. Every other row is Inconclusive/Mismatch at all loci and scores
 * exactly the epsilon floor.
 *
 * Allele values are quantised to 1/kQuantScale; lookups probe the
 * neighbouring buckets too, so rounding never drops a qualifying row.
 * Values too large to quantise are not indexed: rows holding one are always
 * returned, and a query holding one gets every row.
 * It may return extra rows, never fewer.
 */
class CandidateIndex {
public:
    static constexpr int64_t kQuantScale = 1000;
    // |value| * kQuantScale must stay below 2^62 so key +- offset cannot overflow
    static constexpr double kMaxIndexedMagnitude = 4611686018427387904.0 / kQuantScale;

    explicit CandidateIndex(const ProfileDatabase& db);

    // Sorted, unique row indices.
    std::vector<uint32_t> candidates_for(const std::vector<MaybeAlleles>& query_aligned) const;

    size_t num_rows() const { return num_rows_; }
    size_t num_postings() const { return num_postings_; }
    size_t num_unindexed_rows() const { return unindexed_rows_.size(); }

    static bool indexable(double value);
    // Only valid for indexable() values.
    static int64_t quantize(double value);

private:
    using Postings = std::unordered_map<int64_t, std::vector<uint32_t>>;

    size_t num_rows_ = 0;
    size_t num_postings_ = 0;
    std::vector<Postings> loci_;  // one map per schema locus
    std::vector<uint32_t> unindexed_rows_;  // rows with an allele outside the key range
};

}  // namespace strmatch

#endif  // STRMATCH_CANDIDATE_INDEX_H
