#ifndef STRMATCH_RUN_CONFIG_H
#define STRMATCH_RUN_CONFIG_H

#include "batch_runner.h"
#include "table_reader.h"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace strmatch {

// ============================================================================
// Run Configuration
// ============================================================================

struct RunConfig {
    // Inputs / outputs
    std::string database_path;
    std::string queries_path;
    std::string output_path = "matches.tsv";  // "-": stdout

    // Table format
    std::string id_column = kDefaultIdColumn;
    char delimiter = ',';
    bool strict = false;

    // Execution
    int num_threads = 0;       // <= 0: hardware concurrency
    bool use_prefilter = false;
    size_t shard_size = 32768;

    // Reporting
    bool verbose = true;       // progress output only
    bool show_help = false;
    bool show_version = false;

    TableReaderOptions table_options() const;
    BatchRunner::Config batch_config() const;
};

/**
 * Parse command-line flags. STRMATCH_THREADS in the environment sets the
 * default worker count; --threads overrides it.
 * Throws std::runtime_error on unknown flags, missing values or bad numbers.
 */
RunConfig parse_run_config(int argc, const char* const* argv);

void print_usage(std::ostream& out, const char* prog);

}  // namespace strmatch

#endif  // STRMATCH_RUN_CONFIG_H
