#ifndef STRMATCH_PROFILE_SCORER_H
#define STRMATCH_PROFILE_SCORER_H

#include "locus_evaluator.h"
#include "profile.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace strmatch {

// ============================================================================
// Score constants
// ============================================================================

constexpr double kConsistentWeight = 2.0;
constexpr double kMutatedWeight = 1.0;
constexpr double kScoreEpsilon = 1e-6;  // 保证 score > 0，posterior 变换不会除零

// ============================================================================
// Per-pair accumulation
// ============================================================================

struct LocusTally {
    int32_t consistent = 0;
    int32_t mutated = 0;
    int32_t inconclusive = 0;
    int32_t mismatch = 0;
    double penalty = 0.0;  // Σ per-locus penalty (0 / 0.5 / 1)

    void add(const LocusEvaluation& eval);
};

/**
 * MatchResult: one scored (query, candidate) pair
 *
 * clr       = max(2*consistent + mutated - penalty, 0) + epsilon
 * posterior = clr / (clr + 1)   (flat 50/50 prior, clr taken as odds)
 */
struct MatchResult {
    std::string candidate_id;
    size_t scan_index = 0;  // row position in the database, used for tie-break

    double clr = kScoreEpsilon;
    double posterior = 0.0;

    int32_t consistent_loci = 0;
    int32_t mutated_loci = 0;
    int32_t inconclusive_loci = 0;
    int32_t mismatch_loci = 0;  // diagnostics only, not part of the output record

    std::string to_string() const;
};

double combine_score(const LocusTally& tally);
double posterior_from_score(double score);

/**
 * Tally one database row against a query laid out in schema order
 * (see ProfileDatabase::align). Pure; touches no shared state.
 */
LocusTally tally_candidate(const std::vector<MaybeAlleles>& query_aligned,
                           const ProfileDatabase& db,
                           size_t row);

MatchResult make_match_result(std::string candidate_id, size_t scan_index,
                              const LocusTally& tally);

MatchResult score_candidate(const std::vector<MaybeAlleles>& query_aligned,
                            const ProfileDatabase& db,
                            size_t row);

/**
 * Score a raw, unparsed candidate record. Every locus in `loci` is visited,
 * the identifier column is skipped. Throws SchemaError if the candidate has
 * no identifier.
 */
MatchResult score_candidate(const QueryProfile& query,
                            const std::vector<std::string>& loci,
                            const RawRecord& candidate,
                            const std::string& id_column = kDefaultIdColumn);

}  // namespace strmatch

#endif  // STRMATCH_PROFILE_SCORER_H
