#include "candidate_index.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace strmatch {

CandidateIndex::CandidateIndex(const ProfileDatabase& db)
    : num_rows_(db.size()), loci_(db.num_loci()) {
    if (db.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("CandidateIndex: database too large for 32-bit row ids");
    }

    for (size_t row = 0; row < db.size(); ++row) {
        for (size_t locus = 0; locus < db.num_loci(); ++locus) {
            const MaybeAlleles& alleles = db.alleles(row, locus);
            if (!alleles) continue;
            for (double value : alleles->values()) {
                if (!indexable(value)) {
                    if (unindexed_rows_.empty() || unindexed_rows_.back() != row) {
                        unindexed_rows_.push_back(static_cast<uint32_t>(row));
                    }
                    continue;
                }
                auto& rows = loci_[locus][quantize(value)];
                // rows arrive in ascending order; an AlleleSet may quantise
                // two values into one bucket
                if (rows.empty() || rows.back() != row) {
                    rows.push_back(static_cast<uint32_t>(row));
                    ++num_postings_;
                }
            }
        }
    }
}

bool CandidateIndex::indexable(double value) {
    return std::isfinite(value) && std::fabs(value) < kMaxIndexedMagnitude;
}

int64_t CandidateIndex::quantize(double value) {
    return std::llround(value * static_cast<double>(kQuantScale));
}

std::vector<uint32_t> CandidateIndex::candidates_for(
    const std::vector<MaybeAlleles>& query_aligned) const {

    std::vector<uint32_t> rows;

    const size_t n = std::min(query_aligned.size(), loci_.size());
    for (size_t locus = 0; locus < n; ++locus) {
        const MaybeAlleles& alleles = query_aligned[locus];
        if (!alleles) continue;
        for (double value : alleles->values()) {
            if (indexable(value)) continue;
            // cannot be probed: scan everything
            rows.resize(num_rows_);
            std::iota(rows.begin(), rows.end(), 0u);
            return rows;
        }
    }

    std::vector<uint8_t> hit(num_rows_, 0);
    size_t hits = 0;
    for (uint32_t row : unindexed_rows_) {
        hit[row] = 1;
        ++hits;
    }

    // exact share: key +-1; single step: key +-kQuantScale, +-1 for rounding
    static constexpr int64_t kOffsets[] = {
        -kQuantScale - 1, -kQuantScale, -kQuantScale + 1,
        -1, 0, 1,
        kQuantScale - 1, kQuantScale, kQuantScale + 1
    };

    for (size_t locus = 0; locus < n; ++locus) {
        const MaybeAlleles& alleles = query_aligned[locus];
        if (!alleles) continue;
        const Postings& postings = loci_[locus];
        for (double value : alleles->values()) {
            const int64_t key = quantize(value);
            for (int64_t offset : kOffsets) {
                auto it = postings.find(key + offset);
                if (it == postings.end()) continue;
                for (uint32_t row : it->second) {
                    if (!hit[row]) {
                        hit[row] = 1;
                        ++hits;
                    }
                }
            }
        }
    }

    rows.reserve(hits);
    for (size_t row = 0; row < num_rows_; ++row) {
        if (hit[row]) rows.push_back(static_cast<uint32_t>(row));
    }
    return rows;
}

}  // namespace strmatch
