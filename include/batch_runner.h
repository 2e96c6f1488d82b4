#ifndef STRMATCH_BATCH_RUNNER_H
#define STRMATCH_BATCH_RUNNER_H

#include "match_ranker.h"
#include "profile.h"
#include "profile_scorer.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strmatch {

struct QueryOutcome {
    size_t query_index = 0;
    std::string query_id;  // empty when the query had no identifier
    bool ok = false;
    std::string error;     // SchemaError message when !ok

    std::vector<MatchResult> top_candidates;
    MatchRanker::Stats stats;
};

/**
 * BatchRunner: ranks every query against one shared, read-only database
 *
 * - A SchemaError aborts that query only; the batch continues and the
 *   failure is reported on stderr
 * - Outcomes come back in query order regardless of threading
 * - Query-level parallelism on a TaskQueue when there are enough queries to
 *   keep the workers busy; otherwise queries run one by one and each scan is
 *   sharded instead
 */
class BatchRunner {
public:
    struct Config {
        int num_threads = 0;  // <= 0: hardware concurrency
        std::string id_column = kDefaultIdColumn;
        MatchRanker::Config ranker;
        bool verbose = true;  // progress on stdout; failed queries always go to stderr
        bool log_each_query = false;
    };

    struct Summary {
        int64_t queries = 0;
        int64_t failed = 0;
        int64_t prefilter_fallbacks = 0;
        double elapsed_seconds = 0.0;
    };

    BatchRunner(std::shared_ptr<const ProfileDatabase> db, Config config);

    std::vector<QueryOutcome> run(const std::vector<RawRecord>& queries,
                                  Summary* summary = nullptr) const;

    // One query; never throws SchemaError, it is captured in the outcome.
    QueryOutcome run_one(const RawRecord& query, size_t query_index,
                         const MatchRanker& ranker) const;

    const Config& config() const { return config_; }

private:
    std::shared_ptr<const ProfileDatabase> db_;
    Config config_;
};

}  // namespace strmatch

#endif  // STRMATCH_BATCH_RUNNER_H
