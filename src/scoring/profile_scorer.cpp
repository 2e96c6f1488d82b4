#include "profile_scorer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace strmatch {

void LocusTally::add(const LocusEvaluation& eval) {
    switch (eval.verdict) {
        case LocusVerdict::kConsistent: ++consistent; break;
        case LocusVerdict::kMutated: ++mutated; break;
        case LocusVerdict::kInconclusive: ++inconclusive; break;
        case LocusVerdict::kMismatch: ++mismatch; break;
    }
    penalty += eval.penalty;
}

double combine_score(const LocusTally& tally) {
    const double raw = kConsistentWeight * tally.consistent +
                       kMutatedWeight * tally.mutated -
                       tally.penalty;
    return std::max(raw, 0.0) + kScoreEpsilon;
}

double posterior_from_score(double score) {
    return score / (score + 1.0);
}

LocusTally tally_candidate(const std::vector<MaybeAlleles>& query_aligned,
                           const ProfileDatabase& db,
                           size_t row) {
    LocusTally tally;
    const size_t n = db.num_loci();
    for (size_t locus = 0; locus < n; ++locus) {
        tally.add(evaluate_locus(query_aligned[locus], db.alleles(row, locus)));
    }
    return tally;
}

MatchResult make_match_result(std::string candidate_id, size_t scan_index,
                              const LocusTally& tally) {
    MatchResult result;
    result.candidate_id = std::move(candidate_id);
    result.scan_index = scan_index;
    result.clr = combine_score(tally);
    result.posterior = posterior_from_score(result.clr);
    result.consistent_loci = tally.consistent;
    result.mutated_loci = tally.mutated;
    result.inconclusive_loci = tally.inconclusive;
    result.mismatch_loci = tally.mismatch;
    return result;
}

MatchResult score_candidate(const std::vector<MaybeAlleles>& query_aligned,
                            const ProfileDatabase& db,
                            size_t row) {
    return make_match_result(db.id(row), row, tally_candidate(query_aligned, db, row));
}

MatchResult score_candidate(const QueryProfile& query,
                            const std::vector<std::string>& loci,
                            const RawRecord& candidate,
                            const std::string& id_column) {
    const RawField id = candidate.get(id_column);
    if (!id || trim_field(*id).empty()) {
        throw SchemaError("candidate record has no '" + id_column + "' identifier");
    }

    static const MaybeAlleles kAbsent;

    LocusTally tally;
    for (const auto& locus : loci) {
        if (locus == id_column) continue;
        const MaybeAlleles* q = query.find(locus);
        const MaybeAlleles c = parse_alleles(candidate.get(locus));
        tally.add(evaluate_locus(q != nullptr ? *q : kAbsent, c));
    }
    return make_match_result(std::string(trim_field(*id)), 0, tally);
}

std::string MatchResult::to_string() const {
    std::ostringstream oss;
    oss << "ID=" << candidate_id
        << " CLR=" << std::setprecision(10) << clr
        << " POSTERIOR=" << std::setprecision(6) << posterior
        << " CONSISTENT=" << consistent_loci
        << " MUTATED=" << mutated_loci
        << " INCONCLUSIVE=" << inconclusive_loci
        << " MISMATCH=" << mismatch_loci;
    return oss.str();
}

}  // namespace strmatch
