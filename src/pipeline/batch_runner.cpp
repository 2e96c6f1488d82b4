#include "batch_runner.h"
#include "task_queue.h"

#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace strmatch {

BatchRunner::BatchRunner(std::shared_ptr<const ProfileDatabase> db, Config config)
    : db_(std::move(db)), config_(std::move(config)) {
    if (!db_) {
        throw std::runtime_error("BatchRunner requires a database");
    }
}

QueryOutcome BatchRunner::run_one(const RawRecord& query, size_t query_index,
                                  const MatchRanker& ranker) const {
    QueryOutcome outcome;
    outcome.query_index = query_index;
    if (const RawField id = query.get(config_.id_column)) {
        outcome.query_id = std::string(trim_field(*id));
    }

    try {
        const QueryProfile profile = make_query_profile(query, config_.id_column);
        if (config_.verbose && config_.log_each_query) {
            std::ostringstream line;
            line << "  Matching query " << profile.id << "...\n";
            std::cout << line.str() << std::flush;
        }
        outcome.top_candidates = ranker.rank(profile, &outcome.stats);
        outcome.ok = true;
    } catch (const SchemaError& e) {
        outcome.ok = false;
        outcome.error = e.what();
        std::ostringstream line;
        line << "[BatchRunner] query #" << query_index << " skipped: " << e.what() << '\n';
        std::cerr << line.str();
    }
    return outcome;
}

std::vector<QueryOutcome> BatchRunner::run(const std::vector<RawRecord>& queries,
                                           Summary* summary) const {
    const auto start_time = std::chrono::steady_clock::now();

    const int workers = resolve_worker_count(config_.num_threads);
    const bool query_parallel =
        workers > 1 && queries.size() >= static_cast<size_t>(workers);

    // 查询级并行时每次扫描保持串行，避免线程过度订阅
    MatchRanker::Config ranker_config = config_.ranker;
    if (query_parallel || workers == 1) {
        ranker_config.parallel_scan = false;
    }
    const MatchRanker ranker(*db_, ranker_config);

    if (config_.verbose) {
        std::cout << "Processing " << queries.size() << " queries against "
                  << db_->size() << " candidates ("
                  << (query_parallel ? "query-parallel, " : "scan-parallel, ")
                  << workers << " workers)..." << std::endl;
    }

    std::vector<QueryOutcome> outcomes;
    outcomes.reserve(queries.size());

    if (query_parallel) {
        TaskQueue pool(workers);
        std::vector<std::future<QueryOutcome>> futures;
        futures.reserve(queries.size());
        for (size_t i = 0; i < queries.size(); ++i) {
            futures.push_back(pool.submit([this, i, &queries, &ranker]() {
                return run_one(queries[i], i, ranker);
            }));
        }
        for (auto& f : futures) {
            outcomes.push_back(f.get());
        }
    } else {
        for (size_t i = 0; i < queries.size(); ++i) {
            outcomes.push_back(run_one(queries[i], i, ranker));
        }
    }

    Summary s;
    s.queries = static_cast<int64_t>(outcomes.size());
    for (const auto& o : outcomes) {
        if (!o.ok) ++s.failed;
        if (o.stats.prefilter_fallback) ++s.prefilter_fallbacks;
    }
    s.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();

    if (config_.verbose) {
        std::cout << "All queries processed. (" << s.queries << " queries, "
                  << s.failed << " failed, " << s.elapsed_seconds << " s)" << std::endl;
        if (ranker_config.use_prefilter) {
            std::cout << "[BatchRunner] prefilter fell back to full scan for "
                      << s.prefilter_fallbacks << " queries" << std::endl;
        }
    }

    if (summary) *summary = s;
    return outcomes;
}

}  // namespace strmatch
