#include "allele_parser.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>
#include <system_error>
#include <utility>

namespace strmatch {

AlleleSet::AlleleSet(std::vector<double> values) : values_(std::move(values)) {
    std::sort(values_.begin(), values_.end());
    values_.erase(std::unique(values_.begin(), values_.end()), values_.end());
}

bool AlleleSet::contains(double value) const {
    return std::binary_search(values_.begin(), values_.end(), value);
}

bool AlleleSet::shares_with(const AlleleSet& other) const {
    // both sides sorted: linear merge walk
    auto a = values_.begin();
    auto b = other.values_.begin();
    while (a != values_.end() && b != other.values_.end()) {
        if (*a == *b) return true;
        if (*a < *b) {
            ++a;
        } else {
            ++b;
        }
    }
    return false;
}

std::string AlleleSet::to_string() const {
    std::ostringstream oss;
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) oss << ',';
        oss << values_[i];
    }
    return oss.str();
}

std::string_view trim_field(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const size_t first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    const size_t last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

bool parse_allele_token(std::string_view token, double& value) {
    token = trim_field(token);
    if (token.empty()) return false;

    // from_chars rejects a leading '+', strtod-style parsers accept it
    if (token.front() == '+') {
        token.remove_prefix(1);
        if (token.empty() || token.front() == '+' || token.front() == '-') {
            return false;
        }
    }

    double parsed = 0.0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) return false;
    if (!std::isfinite(parsed)) return false;

    value = parsed;
    return true;
}

MaybeAlleles parse_alleles(RawField field) {
    if (!field) return std::nullopt;

    const std::string_view text = trim_field(*field);
    if (text.empty() || text == "-") return std::nullopt;

    std::vector<double> values;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();

        double value = 0.0;
        if (parse_allele_token(text.substr(start, comma - start), value)) {
            values.push_back(value);
        }
        start = comma + 1;
    }

    if (values.empty()) return std::nullopt;
    return AlleleSet(std::move(values));
}

}  // namespace strmatch
