#ifndef STRMATCH_RESULT_WRITER_H
#define STRMATCH_RESULT_WRITER_H

#include "batch_runner.h"

#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <string>
#include <vector>

namespace strmatch {

/**
 * ResultWriter: ranked matches as TSV
 *
 * query_id  rank  person_id  clr  posterior  consistent_loci  mutated_loci  inconclusive_loci
 *
 * One line per retained candidate, rank starting at 1. Failed queries
 * produce no lines.
 */
class ResultWriter {
public:
    // Empty path or "-" writes to stdout.
    explicit ResultWriter(const std::string& path);
    explicit ResultWriter(std::ostream& out);

    void write_header();
    void write(const QueryOutcome& outcome);
    void write_all(const std::vector<QueryOutcome>& outcomes);

    int64_t records_written() const { return records_; }

private:
    std::ofstream ofs_;
    std::ostream* out_ = nullptr;
    int64_t records_ = 0;
};

}  // namespace strmatch

#endif  // STRMATCH_RESULT_WRITER_H
