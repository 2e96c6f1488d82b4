#ifndef STRMATCH_MATCH_RANKER_H
#define STRMATCH_MATCH_RANKER_H

#include "candidate_index.h"
#include "profile.h"
#include "profile_scorer.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace strmatch {

constexpr size_t kTopK = 10;

/**
 * Result order: clr descending, then scan index ascending.
 * Equal scores keep database order, the same order a stable sort by score
 * would give, and shard merges cannot change it.
 */
bool ranks_before(const MatchResult& a, const MatchResult& b);

/**
 * TopKCollector: fixed-capacity retention of the best results
 * - items() is always sorted best first
 * - admits() lets the scan reject a pair before building a MatchResult
 */
class TopKCollector {
public:
    explicit TopKCollector(size_t capacity = kTopK);

    bool admits(double clr, size_t scan_index) const;
    void offer(MatchResult result);
    void merge(const TopKCollector& other);

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool full() const { return items_.size() >= capacity_; }

    const std::vector<MatchResult>& items() const { return items_; }
    std::vector<MatchResult> release() { return std::move(items_); }

private:
    size_t capacity_;
    std::vector<MatchResult> items_;
};

/**
 * MatchRanker: full-database scan for one query, top-K retention
 *
 * - Candidates with the query's identifier are skipped
 * - The scan is split into shards; each shard keeps a local TopKCollector and
 *   the locals are merged with ranks_before(), so the parallel result is
 *   identical to the serial one
 * - With use_prefilter a CandidateIndex narrows the scan; when the narrowed
 *   top-K is not provably final the ranker falls back to the full scan
 * - The database must stay unchanged while the ranker is alive
 */
class MatchRanker {
public:
    struct Config {
        bool parallel_scan = true;    // std::execution::par over shards
        size_t shard_size = 32768;    // 每个分片的候选行数
        bool use_prefilter = false;   // 等位基因倒排索引预筛
    };

    struct Stats {
        int64_t candidates_scanned = 0;
        int64_t self_skipped = 0;
        int64_t prefilter_rows = 0;
        bool prefilter_used = false;
        bool prefilter_fallback = false;
    };

    explicit MatchRanker(const ProfileDatabase& db);
    MatchRanker(const ProfileDatabase& db, Config config);

    std::vector<MatchResult> rank(const QueryProfile& query, Stats* stats = nullptr) const;

    const Config& config() const { return config_; }
    const ProfileDatabase& database() const { return db_; }
    const CandidateIndex* index() const { return index_.get(); }

private:
    struct ScanCounts {
        int64_t scanned = 0;
        int64_t self_skipped = 0;
    };

    // Scans positions [begin, end) of `rows`, or of the whole database when
    // rows is nullptr.
    void scan_range(const std::vector<MaybeAlleles>& query_aligned,
                    const std::string& query_id,
                    const std::vector<uint32_t>* rows,
                    size_t begin, size_t end,
                    TopKCollector& out,
                    ScanCounts& counts) const;

    TopKCollector scan(const std::vector<MaybeAlleles>& query_aligned,
                       const std::string& query_id,
                       const std::vector<uint32_t>* rows,
                       ScanCounts& counts) const;

    const ProfileDatabase& db_;
    Config config_;
    std::unique_ptr<CandidateIndex> index_;
};

// Convenience: default ranker, serial scan.
std::vector<MatchResult> rank_candidates(const QueryProfile& query,
                                         const ProfileDatabase& db);

}  // namespace strmatch

#endif  // STRMATCH_MATCH_RANKER_H
