#include "result_writer.h"

#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace strmatch {

ResultWriter::ResultWriter(const std::string& path) {
    if (path.empty() || path == "-") {
        out_ = &std::cout;
        return;
    }
    ofs_.open(path);
    if (!ofs_.is_open()) {
        throw std::runtime_error("Cannot open output for writing: " + path);
    }
    out_ = &ofs_;
}

ResultWriter::ResultWriter(std::ostream& out) : out_(&out) {}

void ResultWriter::write_header() {
    *out_ << "query_id\trank\tperson_id\tclr\tposterior\t"
             "consistent_loci\tmutated_loci\tinconclusive_loci\n";
}

void ResultWriter::write(const QueryOutcome& outcome) {
    if (!outcome.ok) return;

    int rank = 1;
    for (const auto& m : outcome.top_candidates) {
        *out_ << outcome.query_id << '\t'
              << rank++ << '\t'
              << m.candidate_id << '\t'
              << std::setprecision(10) << m.clr << '\t'
              << std::setprecision(6) << m.posterior << '\t'
              << m.consistent_loci << '\t'
              << m.mutated_loci << '\t'
              << m.inconclusive_loci << '\n';
        ++records_;
    }
}

void ResultWriter::write_all(const std::vector<QueryOutcome>& outcomes) {
    write_header();
    for (const auto& o : outcomes) {
        write(o);
    }
    out_->flush();
    if (!*out_) {
        throw std::runtime_error("Failed while writing results");
    }
}

}  // namespace strmatch
