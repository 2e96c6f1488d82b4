#ifndef STRMATCH_ALLELE_PARSER_H
#define STRMATCH_ALLELE_PARSER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strmatch {

/**
 * AlleleSet: numeric alleles observed at one locus
 * - Values are kept sorted and de-duplicated (set semantics, not multiset)
 * - Microvariants (9.3) are plain fractional values
 * - A set produced by parse_alleles() is never empty
 */
class AlleleSet {
public:
    AlleleSet() = default;
    explicit AlleleSet(std::vector<double> values);

    const std::vector<double>& values() const { return values_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    bool contains(double value) const;

    // True if at least one value is present in both sets (exact equality).
    bool shares_with(const AlleleSet& other) const;

    std::string to_string() const;

private:
    std::vector<double> values_;
};

// nullopt == missing data at this locus
using MaybeAlleles = std::optional<AlleleSet>;

// Raw locus field as supplied by a table row; nullopt is the missing-data marker.
using RawField = std::optional<std::string_view>;

std::string_view trim_field(std::string_view text);

/**
 * Parse one allele token ("9", " 9.3 ", "+10").
 * Returns false for anything that is not a finite decimal number.
 */
bool parse_allele_token(std::string_view token, double& value);

/**
 * Parse a raw locus field into an AlleleSet.
 *
 * Missing marker, empty text and "-" are absent. Otherwise the field is split
 * on ',' and every token that parses is kept; bad tokens are dropped silently.
 * If nothing survives the field is absent.
 */
MaybeAlleles parse_alleles(RawField field);

}  // namespace strmatch

#endif  // STRMATCH_ALLELE_PARSER_H
