#include "match_ranker.h"

#include <algorithm>
#include <execution>
#include <numeric>
#include <utility>

namespace strmatch {

bool ranks_before(const MatchResult& a, const MatchResult& b) {
    if (a.clr != b.clr) return a.clr > b.clr;
    return a.scan_index < b.scan_index;
}

// ============================================================================
// TopKCollector
// ============================================================================

TopKCollector::TopKCollector(size_t capacity) : capacity_(capacity) {
    items_.reserve(capacity_ + 1);
}

bool TopKCollector::admits(double clr, size_t scan_index) const {
    if (capacity_ == 0) return false;
    if (!full()) return true;
    const MatchResult& worst = items_.back();
    if (clr != worst.clr) return clr > worst.clr;
    return scan_index < worst.scan_index;
}

void TopKCollector::offer(MatchResult result) {
    if (!admits(result.clr, result.scan_index)) return;

    auto pos = std::upper_bound(items_.begin(), items_.end(), result, ranks_before);
    items_.insert(pos, std::move(result));
    if (items_.size() > capacity_) {
        items_.pop_back();
    }
}

void TopKCollector::merge(const TopKCollector& other) {
    for (const auto& item : other.items_) {
        if (!admits(item.clr, item.scan_index)) break;  // other is sorted too
        offer(item);
    }
}

// ============================================================================
// MatchRanker
// ============================================================================

MatchRanker::MatchRanker(const ProfileDatabase& db) : MatchRanker(db, Config()) {}

MatchRanker::MatchRanker(const ProfileDatabase& db, Config config)
    : db_(db), config_(config) {
    if (config_.shard_size == 0) config_.shard_size = 1;
    if (config_.use_prefilter) {
        index_ = std::make_unique<CandidateIndex>(db_);
    }
}

void MatchRanker::scan_range(const std::vector<MaybeAlleles>& query_aligned,
                             const std::string& query_id,
                             const std::vector<uint32_t>* rows,
                             size_t begin, size_t end,
                             TopKCollector& out,
                             ScanCounts& counts) const {
    for (size_t i = begin; i < end; ++i) {
        const size_t row = rows ? (*rows)[i] : i;
        if (db_.id(row) == query_id) {
            ++counts.self_skipped;
            continue;
        }
        ++counts.scanned;

        const LocusTally tally = tally_candidate(query_aligned, db_, row);
        const double clr = combine_score(tally);
        if (!out.admits(clr, row)) continue;
        out.offer(make_match_result(db_.id(row), row, tally));
    }
}

TopKCollector MatchRanker::scan(const std::vector<MaybeAlleles>& query_aligned,
                                const std::string& query_id,
                                const std::vector<uint32_t>* rows,
                                ScanCounts& counts) const {
    const size_t total = rows ? rows->size() : db_.size();

    TopKCollector merged(kTopK);
    if (!config_.parallel_scan || total <= config_.shard_size) {
        scan_range(query_aligned, query_id, rows, 0, total, merged, counts);
        return merged;
    }

    const size_t num_shards = (total + config_.shard_size - 1) / config_.shard_size;
    std::vector<TopKCollector> locals(num_shards, TopKCollector(kTopK));
    std::vector<ScanCounts> local_counts(num_shards);

    std::vector<size_t> indices(num_shards);
    std::iota(indices.begin(), indices.end(), 0);

    std::for_each(std::execution::par, indices.begin(), indices.end(),
        [&](size_t shard) {
            const size_t begin = shard * config_.shard_size;
            const size_t end = std::min(total, begin + config_.shard_size);
            scan_range(query_aligned, query_id, rows, begin, end,
                       locals[shard], local_counts[shard]);
        });

    for (size_t shard = 0; shard < num_shards; ++shard) {
        merged.merge(locals[shard]);
        counts.scanned += local_counts[shard].scanned;
        counts.self_skipped += local_counts[shard].self_skipped;
    }
    return merged;
}

std::vector<MatchResult> MatchRanker::rank(const QueryProfile& query, Stats* stats) const {
    const std::vector<MaybeAlleles> aligned = db_.align(query);

    ScanCounts counts;
    if (index_) {
        const std::vector<uint32_t> rows = index_->candidates_for(aligned);
        TopKCollector narrowed = scan(aligned, query.id, &rows, counts);

        // Rows outside the index hit all score exactly kScoreEpsilon; they
        // can only matter if the narrowed top-K has room or holds a floor score.
        const bool final_result =
            narrowed.full() && narrowed.items().back().clr > kScoreEpsilon;
        if (stats) {
            stats->prefilter_used = true;
            stats->prefilter_rows = static_cast<int64_t>(rows.size());
            stats->prefilter_fallback = !final_result;
        }
        if (final_result) {
            if (stats) {
                stats->candidates_scanned = counts.scanned;
                stats->self_skipped = counts.self_skipped;
            }
            return narrowed.release();
        }
        counts = ScanCounts{};
    }

    TopKCollector collector = scan(aligned, query.id, nullptr, counts);
    if (stats) {
        stats->candidates_scanned = counts.scanned;
        stats->self_skipped = counts.self_skipped;
    }
    return collector.release();
}

std::vector<MatchResult> rank_candidates(const QueryProfile& query,
                                         const ProfileDatabase& db) {
    MatchRanker::Config config;
    config.parallel_scan = false;
    return MatchRanker(db, config).rank(query);
}

}  // namespace strmatch
