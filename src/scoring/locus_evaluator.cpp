#include "locus_evaluator.h"

#include <cmath>

namespace strmatch {

bool single_step_apart(const AlleleSet& query, const AlleleSet& candidate) {
    for (double q : query.values()) {
        for (double c : candidate.values()) {
            if (std::fabs(std::fabs(q - c) - kRepeatStep) <= kRepeatStepTolerance) {
                return true;
            }
        }
    }
    return false;
}

LocusEvaluation evaluate_locus(const MaybeAlleles& query,
                               const MaybeAlleles& candidate) {
    LocusEvaluation eval;

    if (!query || !candidate) {
        eval.verdict = LocusVerdict::kInconclusive;
        return eval;
    }

    if (query->shares_with(*candidate)) {
        eval.verdict = LocusVerdict::kConsistent;
        return eval;
    }

    if (single_step_apart(*query, *candidate)) {
        eval.verdict = LocusVerdict::kMutated;
        eval.penalty = kMutatedPenalty;
        return eval;
    }

    eval.verdict = LocusVerdict::kMismatch;
    eval.penalty = kMismatchPenalty;
    return eval;
}

const char* verdict_to_string(LocusVerdict verdict) {
    switch (verdict) {
        case LocusVerdict::kConsistent: return "CONSISTENT";
        case LocusVerdict::kMutated: return "MUTATED";
        case LocusVerdict::kInconclusive: return "INCONCLUSIVE";
        case LocusVerdict::kMismatch: return "MISMATCH";
    }
    return "UNKNOWN";
}

}  // namespace strmatch
