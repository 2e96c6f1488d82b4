#ifndef STRMATCH_LOCUS_EVALUATOR_H
#define STRMATCH_LOCUS_EVALUATOR_H

#include "allele_parser.h"

#include <cstdint>

namespace strmatch {

enum class LocusVerdict : uint8_t {
    kConsistent = 0,    // at least one shared allele
    kMutated = 1,       // no shared allele, some pair one repeat unit apart
    kInconclusive = 2,  // missing data on either side
    kMismatch = 3       // exclusionary
};

constexpr double kMutatedPenalty = 0.5;
constexpr double kMismatchPenalty = 1.0;

// |q - c| is compared against one repeat unit with this absolute tolerance.
constexpr double kRepeatStep = 1.0;
constexpr double kRepeatStepTolerance = 1e-9;

struct LocusEvaluation {
    LocusVerdict verdict = LocusVerdict::kInconclusive;
    double penalty = 0.0;
};

// Any (query, candidate) pair exactly one repeat step apart.
bool single_step_apart(const AlleleSet& query, const AlleleSet& candidate);

/**
 * Classify one locus.
 * Order: missing data -> shared allele -> single-step mutation -> mismatch.
 * Missing data is never evidence against a match.
 */
LocusEvaluation evaluate_locus(const MaybeAlleles& query,
                               const MaybeAlleles& candidate);

const char* verdict_to_string(LocusVerdict verdict);

}  // namespace strmatch

#endif  // STRMATCH_LOCUS_EVALUATOR_H
