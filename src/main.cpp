/**
 * STRMATCH - STR profile match ranking
 *
 * Phases:
 * 1. Load candidate database (parsed once, read-only afterwards)
 * 2. Load query profiles
 * 3. Rank every query against the full database (top 10 per query)
 * 4. Write ranked matches as TSV
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "batch_runner.h"
#include "profile.h"
#include "result_writer.h"
#include "run_config.h"
#include "table_reader.h"

namespace {

constexpr const char* kVersion = "0.3.0";

int run(const strmatch::RunConfig& config) {
    using namespace strmatch;

    const auto start_time = std::chrono::steady_clock::now();
    const TableReaderOptions table_options = config.table_options();

    if (config.verbose) {
        std::cout << "=== STRMATCH v" << kVersion << " - STR Profile Matching ===" << std::endl;
        std::cout << "Database: " << config.database_path << std::endl;
        std::cout << "Queries:  " << config.queries_path << std::endl;
        std::cout << "\nLoading database and queries..." << std::endl;
    }

    // Phase 1
    LoadStats db_stats;
    auto db = std::make_shared<const ProfileDatabase>(
        load_profile_database(config.database_path, table_options,
                              config.id_column, &db_stats));
    if (config.verbose) {
        std::cout << "  Candidates: " << db->size() << " (" << db->num_loci()
                  << " loci, " << db_stats.skipped << " rows skipped, "
                  << db_stats.elapsed_seconds << " s)" << std::endl;
    }

    // Phase 2
    LoadStats query_stats;
    const std::vector<RawRecord> queries =
        load_query_records(config.queries_path, table_options, &query_stats);
    if (config.verbose) {
        std::cout << "  Queries:    " << queries.size() << " ("
                  << query_stats.skipped << " rows skipped)" << std::endl;
    }

    // Phase 3
    BatchRunner runner(db, config.batch_config());
    BatchRunner::Summary summary;
    const auto outcomes = runner.run(queries, &summary);

    // Phase 4
    ResultWriter writer(config.output_path);
    writer.write_all(outcomes);

    if (config.verbose) {
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        std::cout << "\n=== Summary ===" << std::endl;
        std::cout << "Queries ranked:  " << (summary.queries - summary.failed) << std::endl;
        std::cout << "Queries failed:  " << summary.failed << std::endl;
        std::cout << "Matches written: " << writer.records_written()
                  << " -> " << config.output_path << std::endl;
        std::cout << "Total time:      " << elapsed << " s" << std::endl;
    }

    if (summary.failed > 0) {
        std::cerr << "[strmatch] " << summary.failed << " of " << summary.queries
                  << " queries failed and have no ranked matches" << std::endl;
    }

    return summary.failed > 0 && summary.failed == summary.queries ? 2 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const strmatch::RunConfig config = strmatch::parse_run_config(argc, argv);
        if (config.show_help) {
            strmatch::print_usage(std::cout, argv[0]);
            return 0;
        }
        if (config.show_version) {
            std::cout << kVersion << std::endl;
            return 0;
        }
        return run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (argc < 2) {
            strmatch::print_usage(std::cerr, argv[0]);
        }
        return 1;
    }
}
