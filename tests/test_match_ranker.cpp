#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "candidate_index.h"
#include "match_ranker.h"
#include "profile.h"
#include "profile_scorer.h"

using namespace strmatch;

// ============================================================================
// Test Helpers
// ============================================================================

static std::vector<std::string> make_loci(size_t n) {
    std::vector<std::string> loci;
    for (size_t i = 0; i < n; ++i) loci.push_back("L" + std::to_string(i + 1));
    return loci;
}

static QueryProfile make_query(const std::string& id,
                               const std::vector<std::string>& loci,
                               const std::vector<std::string>& values) {
    RawRecord r;
    r.fields["PersonID"] = id;
    for (size_t i = 0; i < loci.size() && i < values.size(); ++i) {
        r.fields[loci[i]] = values[i];
    }
    return make_query_profile(r);
}

static std::vector<std::optional<std::string>> row_of(const std::vector<std::string>& values) {
    std::vector<std::optional<std::string>> row;
    for (const auto& v : values) row.emplace_back(v);
    return row;
}

// Random STR-like field: one or two alleles in 8..14, sometimes a microvariant,
// sometimes missing.
static std::string random_field(std::mt19937& rng) {
    std::uniform_int_distribution<int> allele(8, 14);
    std::uniform_int_distribution<int> pct(0, 99);
    const int roll = pct(rng);
    if (roll < 5) return "-";
    std::string out = std::to_string(allele(rng));
    if (roll < 15) out += ".3";
    if (roll > 40) out += "," + std::to_string(allele(rng));
    return out;
}

static ProfileDatabase make_random_db(size_t rows, size_t num_loci, uint32_t seed) {
    std::mt19937 rng(seed);
    ProfileDatabase db(make_loci(num_loci));
    db.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        std::vector<std::string> values;
        for (size_t l = 0; l < num_loci; ++l) values.push_back(random_field(rng));
        db.add_row("P" + std::to_string(r), row_of(values));
    }
    return db;
}

// Reference ranking: score everything, stable sort by score, truncate.
static std::vector<MatchResult> brute_force(const QueryProfile& q, const ProfileDatabase& db) {
    const auto aligned = db.align(q);
    std::vector<MatchResult> all;
    for (size_t row = 0; row < db.size(); ++row) {
        if (db.id(row) == q.id) continue;
        all.push_back(score_candidate(aligned, db, row));
    }
    std::stable_sort(all.begin(), all.end(), [](const MatchResult& a, const MatchResult& b) {
        return a.clr > b.clr;
    });
    if (all.size() > kTopK) all.resize(kTopK);
    return all;
}

static bool same_ranking(const std::vector<MatchResult>& a, const std::vector<MatchResult>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].candidate_id != b[i].candidate_id) return false;
        if (a[i].clr != b[i].clr) return false;
        if (a[i].scan_index != b[i].scan_index) return false;
    }
    return true;
}

// ============================================================================
// TopKCollector
// ============================================================================

void test_top_k_collector() {
    std::cout << "Testing TopKCollector..." << std::endl;

    TopKCollector c(3);
    auto mk = [](double clr, size_t idx) {
        MatchResult r;
        r.clr = clr;
        r.scan_index = idx;
        r.candidate_id = "C" + std::to_string(idx);
        return r;
    };

    c.offer(mk(1.0, 0));
    c.offer(mk(5.0, 1));
    c.offer(mk(3.0, 2));
    assert(c.full());
    assert(c.items()[0].clr == 5.0);
    assert(c.items()[2].clr == 1.0);

    // worse than the current worst: rejected
    assert(!c.admits(0.5, 3));
    c.offer(mk(0.5, 3));
    assert(c.items().back().clr == 1.0);

    // tie with the worst but later in scan order: rejected
    assert(!c.admits(1.0, 9));
    // tie but earlier scan index: admitted
    assert(c.admits(3.0, 0));

    c.offer(mk(4.0, 4));
    assert(c.size() == 3);
    assert(c.items()[0].scan_index == 1);
    assert(c.items()[1].scan_index == 4);
    assert(c.items()[2].scan_index == 2);

    TopKCollector other(3);
    other.offer(mk(6.0, 10));
    other.offer(mk(3.0, 11));
    c.merge(other);
    assert(c.items()[0].scan_index == 10);
    assert(c.items()[1].scan_index == 1);
    assert(c.items()[2].scan_index == 4);

    std::cout << "  TopKCollector tests passed!" << std::endl;
}

// ============================================================================
// Ranking properties
// ============================================================================

void test_self_exclusion() {
    std::cout << "Testing self exclusion..." << std::endl;

    const auto loci = make_loci(2);
    ProfileDatabase db(loci);
    db.add_row("Q1", row_of({"9,10", "12"}));  // identical to the query
    db.add_row("A", row_of({"10", "12"}));
    db.add_row("B", row_of({"20", "30"}));

    auto q = make_query("Q1", loci, {"9,10", "12"});
    MatchRanker::Stats stats;
    auto results = MatchRanker(db).rank(q, &stats);

    assert(results.size() == 2);
    for (const auto& r : results) {
        assert(r.candidate_id != "Q1");
    }
    assert(results[0].candidate_id == "A");
    assert(stats.self_skipped == 1);
    assert(stats.candidates_scanned == 2);

    // identifiers are compared after trimming on both sides
    ProfileDatabase padded(loci);
    padded.add_row(" Q2\t", row_of({"9,10", "12"}));
    padded.add_row("A", row_of({"10", "12"}));
    assert(padded.id(0) == "Q2");
    auto padded_q = make_query("  Q2 ", loci, {"9,10", "12"});
    assert(padded_q.id == "Q2");
    MatchRanker::Stats padded_stats;
    auto padded_results = MatchRanker(padded).rank(padded_q, &padded_stats);
    assert(padded_results.size() == 1);
    assert(padded_results[0].candidate_id == "A");
    assert(padded_stats.self_skipped == 1);

    std::cout << "  Self exclusion tests passed!" << std::endl;
}

void test_small_and_empty() {
    std::cout << "Testing small and empty databases..." << std::endl;

    const auto loci = make_loci(1);
    auto q = make_query("Q", loci, {"10"});

    ProfileDatabase empty(loci);
    assert(MatchRanker(empty).rank(q).empty());

    ProfileDatabase only_self(loci);
    only_self.add_row("Q", row_of({"10"}));
    assert(MatchRanker(only_self).rank(q).empty());

    ProfileDatabase one(loci);
    one.add_row("X", row_of({"25"}));
    auto results = rank_candidates(q, one);
    assert(results.size() == 1);  // never padded to 10
    assert(results[0].candidate_id == "X");
    assert(results[0].clr == kScoreEpsilon);

    std::cout << "  Small database tests passed!" << std::endl;
}

void test_end_to_end_order() {
    std::cout << "Testing end-to-end ranking example..." << std::endl;

    ProfileDatabase db({"PersonID", "L1", "L2"});
    db.add_row("B", row_of({"20", "-"}));
    db.add_row("A", row_of({"10,11", "5"}));

    RawRecord raw;
    raw.fields["PersonID"] = std::string("Q1");
    raw.fields["L1"] = std::string("9,10");
    raw.fields["L2"] = std::string("-");
    auto results = rank_candidates(make_query_profile(raw), db);

    assert(results.size() == 2);
    assert(results[0].candidate_id == "A");
    assert(results[1].candidate_id == "B");
    assert(results[0].consistent_loci == 1);
    assert(results[0].inconclusive_loci == 1);
    assert(results[1].clr == kScoreEpsilon);

    std::cout << "  End-to-end ranking tests passed!" << std::endl;
}

void test_top_k_bound_large() {
    std::cout << "Testing top-K bound on 1000 candidates..." << std::endl;

    // 12 candidates with distinct scores scattered among 988 floor-score rows
    const auto loci = make_loci(12);
    std::vector<std::string> query_values;
    for (size_t i = 0; i < loci.size(); ++i) query_values.push_back(std::to_string(10 + i));
    auto q = make_query("Q", loci, query_values);

    ProfileDatabase db(loci);
    std::vector<size_t> strong_rows = {7, 95, 180, 260, 333, 401, 502, 640, 777, 812, 901, 998};
    size_t next_strong = 0;
    for (size_t row = 0; row < 1000; ++row) {
        std::vector<std::string> values(loci.size(), "50");
        if (next_strong < strong_rows.size() && strong_rows[next_strong] == row) {
            // k consistent loci, rest missing -> score 2k
            const size_t k = next_strong + 1;
            for (size_t l = 0; l < loci.size(); ++l) {
                values[l] = l < k ? query_values[l] : "-";
            }
            ++next_strong;
        }
        db.add_row("P" + std::to_string(row), row_of(values));
    }

    auto results = MatchRanker(db).rank(q);
    assert(results.size() == kTopK);
    for (size_t i = 1; i < results.size(); ++i) {
        assert(results[i - 1].clr > results[i].clr);
    }
    assert(results[0].candidate_id == "P998");
    assert(results[0].consistent_loci == 12);
    assert(results[9].consistent_loci == 3);

    std::cout << "  Top-K bound tests passed!" << std::endl;
}

void test_tie_break_by_scan_order() {
    std::cout << "Testing tie-break by scan order..." << std::endl;

    const auto loci = make_loci(2);
    ProfileDatabase db(loci);
    for (int i = 0; i < 15; ++i) {
        // all identical scores
        db.add_row("T" + std::to_string(i), row_of({"10", "-"}));
    }
    auto q = make_query("Q", loci, {"10", "11"});

    auto results = rank_candidates(q, db);
    assert(results.size() == kTopK);
    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i].candidate_id == "T" + std::to_string(i));
        assert(results[i].scan_index == i);
    }

    std::cout << "  Tie-break tests passed!" << std::endl;
}

void test_matches_brute_force() {
    std::cout << "Testing ranking against brute force..." << std::endl;

    ProfileDatabase db = make_random_db(2000, 16, 42);
    std::mt19937 rng(7);

    for (int trial = 0; trial < 20; ++trial) {
        std::vector<std::string> values;
        for (size_t l = 0; l < db.num_loci(); ++l) values.push_back(random_field(rng));
        // every other query reuses a database id to exercise self exclusion
        const std::string id = trial % 2 == 0 ? "P" + std::to_string(trial * 50) : "QX";
        auto q = make_query(id, db.loci(), values);

        auto expected = brute_force(q, db);
        auto serial = rank_candidates(q, db);
        assert(same_ranking(serial, expected));
    }

    std::cout << "  Brute force comparison passed!" << std::endl;
}

void test_parallel_equals_serial() {
    std::cout << "Testing sharded scan..." << std::endl;

    ProfileDatabase db = make_random_db(3000, 12, 1234);
    std::mt19937 rng(99);

    MatchRanker::Config serial_cfg;
    serial_cfg.parallel_scan = false;
    MatchRanker serial(db, serial_cfg);

    MatchRanker::Config par_cfg;
    par_cfg.parallel_scan = true;
    par_cfg.shard_size = 37;  // many uneven shards
    MatchRanker parallel(db, par_cfg);

    for (int trial = 0; trial < 10; ++trial) {
        std::vector<std::string> values;
        for (size_t l = 0; l < db.num_loci(); ++l) values.push_back(random_field(rng));
        auto q = make_query("P" + std::to_string(trial * 100), db.loci(), values);

        MatchRanker::Stats s1, s2;
        auto a = serial.rank(q, &s1);
        auto b = parallel.rank(q, &s2);
        assert(same_ranking(a, b));
        assert(s1.candidates_scanned == s2.candidates_scanned);
        assert(s2.self_skipped == 1);
    }

    std::cout << "  Sharded scan tests passed!" << std::endl;
}

void test_prefilter() {
    std::cout << "Testing prefilter..." << std::endl;

    // Random data: prefilter must never change the ranking
    {
        ProfileDatabase db = make_random_db(1500, 10, 555);
        MatchRanker::Config cfg;
        cfg.parallel_scan = false;
        cfg.use_prefilter = true;
        MatchRanker filtered(db, cfg);
        assert(filtered.index() != nullptr);

        std::mt19937 rng(3);
        for (int trial = 0; trial < 10; ++trial) {
            std::vector<std::string> values;
            for (size_t l = 0; l < db.num_loci(); ++l) values.push_back(random_field(rng));
            auto q = make_query("Q" + std::to_string(trial), db.loci(), values);
            assert(same_ranking(filtered.rank(q), brute_force(q, db)));
        }
    }

    // Sparse overlap: 12 related rows among 60 unrelated -> narrowed result is final
    {
        const auto loci = make_loci(3);
        ProfileDatabase db(loci);
        for (int i = 0; i < 60; ++i) {
            db.add_row("U" + std::to_string(i), row_of({"50", "60", "70"}));
            if (i % 5 == 0) {
                db.add_row("R" + std::to_string(i), row_of({"10", i % 2 ? "21" : "20", "-"}));
            }
        }
        auto q = make_query("Q", loci, {"10", "20", "30"});

        MatchRanker::Config cfg;
        cfg.parallel_scan = false;
        cfg.use_prefilter = true;
        MatchRanker::Stats stats;
        auto narrowed = MatchRanker(db, cfg).rank(q, &stats);
        assert(stats.prefilter_used);
        assert(!stats.prefilter_fallback);
        assert(stats.prefilter_rows == 12);
        assert(same_ranking(narrowed, brute_force(q, db)));
    }

    // Too few related rows: falls back to the full scan, floor scores in scan order
    {
        const auto loci = make_loci(2);
        ProfileDatabase db(loci);
        db.add_row("U0", row_of({"50", "60"}));
        db.add_row("R0", row_of({"10", "-"}));
        db.add_row("U1", row_of({"51", "61"}));
        auto q = make_query("Q", loci, {"10", "20"});

        MatchRanker::Config cfg;
        cfg.use_prefilter = true;
        MatchRanker::Stats stats;
        auto results = MatchRanker(db, cfg).rank(q, &stats);
        assert(stats.prefilter_fallback);
        assert(results.size() == 3);
        assert(results[0].candidate_id == "R0");
        assert(results[1].candidate_id == "U0");
        assert(results[2].candidate_id == "U1");
    }

    std::cout << "  Prefilter tests passed!" << std::endl;
}

void test_candidate_index() {
    std::cout << "Testing CandidateIndex..." << std::endl;

    const auto loci = make_loci(2);
    ProfileDatabase db(loci);
    db.add_row("A", row_of({"9.3", "-"}));   // one step from 10.3
    db.add_row("B", row_of({"12", "15"}));   // unrelated
    db.add_row("C", row_of({"-", "7,8"}));   // shares 8
    db.add_row("D", row_of({"11.3", "9"}));  // 9 is one step from 8

    CandidateIndex index(db);
    assert(index.num_rows() == 4);
    assert(index.num_postings() == 7);

    auto q = make_query("Q", loci, {"10.3", "8"});
    auto rows = index.candidates_for(db.align(q));
    assert((rows == std::vector<uint32_t>{0, 2, 3}));

    assert(CandidateIndex::quantize(9.3) == 9300);
    assert(CandidateIndex::quantize(10.0) == 10000);

    std::cout << "  CandidateIndex tests passed!" << std::endl;
}

void test_huge_allele_values() {
    std::cout << "Testing alleles outside the index key range..." << std::endl;

    const auto loci = make_loci(2);
    ProfileDatabase db(loci);
    db.add_row("BIG", row_of({"1e17", "-"}));
    db.add_row("A", row_of({"10", "12"}));
    db.add_row("U", row_of({"50", "60"}));
    db.add_row("NEG", row_of({"-1e300", "12"}));

    assert(!CandidateIndex::indexable(1e17));
    assert(!CandidateIndex::indexable(-1e300));
    assert(CandidateIndex::indexable(1e12));

    CandidateIndex index(db);
    assert(index.num_unindexed_rows() == 2);

    // ordinary query: unindexed rows are always candidates
    auto small_q = make_query("Q", loci, {"10", "30"});
    assert((index.candidates_for(db.align(small_q)) == std::vector<uint32_t>{0, 1, 3}));

    // query value that cannot be probed: every row is a candidate
    auto big_q = make_query("Q", loci, {"1e17", "12"});
    assert(index.candidates_for(db.align(big_q)).size() == db.size());

    MatchRanker::Config cfg;
    cfg.parallel_scan = false;
    cfg.use_prefilter = true;
    MatchRanker filtered(db, cfg);
    for (const auto& q : {small_q, big_q}) {
        assert(same_ranking(filtered.rank(q), brute_force(q, db)));
    }
    auto ranked = filtered.rank(big_q);
    assert(ranked[0].candidate_id == "BIG");
    assert(ranked[0].consistent_loci == 1);

    std::cout << "  Out-of-range allele tests passed!" << std::endl;
}

int main() {
    std::cout << "=== Match Ranker Tests ===" << std::endl;

    test_top_k_collector();
    test_self_exclusion();
    test_small_and_empty();
    test_end_to_end_order();
    test_top_k_bound_large();
    test_tie_break_by_scan_order();
    test_matches_brute_force();
    test_parallel_equals_serial();
    test_prefilter();
    test_candidate_index();
    test_huge_allele_values();

    std::cout << "\n=== All match ranker tests passed! ===" << std::endl;
    return 0;
}
