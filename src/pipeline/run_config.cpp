#include "run_config.h"

#include <cstdlib>
#include <ostream>
#include <stdexcept>

namespace strmatch {
namespace {

int parse_int(const std::string& flag, const std::string& value, int min_value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size() || parsed < min_value) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return parsed;
}

char parse_delimiter(const std::string& value) {
    if (value == "tab" || value == "\\t" || value == "\t") return '\t';
    if (value == "comma") return ',';
    if (value.size() == 1 && value[0] != '"') return value[0];
    throw std::runtime_error("Invalid delimiter: " + value);
}

}  // namespace

TableReaderOptions RunConfig::table_options() const {
    TableReaderOptions options;
    options.delimiter = delimiter;
    options.strict = strict;
    options.verbose = verbose;
    return options;
}

BatchRunner::Config RunConfig::batch_config() const {
    BatchRunner::Config config;
    config.num_threads = num_threads;
    config.id_column = id_column;
    config.verbose = verbose;
    config.log_each_query = verbose;
    config.ranker.use_prefilter = use_prefilter;
    config.ranker.shard_size = shard_size;
    return config;
}

RunConfig parse_run_config(int argc, const char* const* argv) {
    RunConfig config;

    if (const char* env_threads = std::getenv("STRMATCH_THREADS")) {
        if (env_threads[0] != '\0') {
            config.num_threads = parse_int("STRMATCH_THREADS", env_threads, 0);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--database" || arg == "-d") { config.database_path = next_value(); continue; }
        if (arg == "--queries" || arg == "-q") { config.queries_path = next_value(); continue; }
        if (arg == "--output" || arg == "-o") { config.output_path = next_value(); continue; }
        if (arg == "--id-column") { config.id_column = next_value(); continue; }
        if (arg == "--delimiter") { config.delimiter = parse_delimiter(next_value()); continue; }
        if (arg == "--threads" || arg == "-t") { config.num_threads = parse_int(arg, next_value(), 0); continue; }
        if (arg == "--shard-size") { config.shard_size = static_cast<size_t>(parse_int(arg, next_value(), 1)); continue; }
        if (arg == "--prefilter") { config.use_prefilter = true; continue; }
        if (arg == "--strict") { config.strict = true; continue; }
        if (arg == "--quiet") { config.verbose = false; continue; }
        if (arg == "--help" || arg == "-h") { config.show_help = true; continue; }
        if (arg == "--version" || arg == "-V") { config.show_version = true; continue; }
        throw std::runtime_error("Unknown argument: " + arg);
    }

    if (config.show_help || config.show_version) return config;

    if (config.database_path.empty() || config.queries_path.empty()) {
        throw std::runtime_error("--database and --queries are required");
    }
    if (config.id_column.empty()) {
        throw std::runtime_error("--id-column must not be empty");
    }
    // results own stdout
    if (config.output_path == "-") {
        config.verbose = false;
    }
    return config;
}

void print_usage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog << " --database <db.csv> --queries <queries.csv> [options]\n"
        << "\n"
        << "Rank database profiles against each query profile (top 10 per query).\n"
        << "\n"
        << "Options:\n"
        << "  -d, --database <path>   Candidate profile table (csv/tsv, .gz/.bgz ok)\n"
        << "  -q, --queries <path>    Query profile table\n"
        << "  -o, --output <path>     Ranked results TSV, - for stdout (default: matches.tsv)\n"
        << "      --id-column <name>  Identifier column (default: PersonID)\n"
        << "      --delimiter <c>     Field delimiter, 'tab' for TSV (default: ,)\n"
        << "  -t, --threads <n>       Worker threads, 0 = all cores (env STRMATCH_THREADS)\n"
        << "      --shard-size <n>    Candidates per scan shard (default: 32768)\n"
        << "      --prefilter         Narrow scans with the allele index\n"
        << "      --strict            Fail on malformed rows instead of skipping\n"
        << "      --quiet             No progress output\n"
        << "  -h, --help              Show this help\n"
        << "  -V, --version           Show version\n";
}

}  // namespace strmatch
