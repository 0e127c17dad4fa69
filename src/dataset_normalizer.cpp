#include "dataset_normalizer.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib> // For std::strtod
#include <sstream>

namespace rate_order {

namespace {

std::string
trim(const std::string &s) {
    const char *ws = " \t\r\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) { return ""; }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string>
split_fields(const std::string &line, Delimiter delimiter) {
    std::vector<std::string> fields;
    if (delimiter == Delimiter::Whitespace) {
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) { fields.push_back(token); }
        return fields;
    }

    const char sep = (delimiter == Delimiter::Comma) ? ',' : '\t';
    std::string::size_type start = 0;
    while (true) {
        const auto pos = line.find(sep, start);
        if (pos == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

// Whole-token parse; anything left over after the number is malformed.
// Underflow to a subnormal or zero is accepted, overflow to +-HUGE_VAL is not.
double
parse_field(const std::string &raw, std::size_t row) {
    const std::string token = trim(raw);
    if (token.empty()) { throw ParseError(ParseErrorKind::MalformedNumber, row, raw); }

    char *end = nullptr;
    errno = 0;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || end != token.c_str() + token.size()) {
        throw ParseError(ParseErrorKind::MalformedNumber, row, raw);
    }
    if (errno == ERANGE && std::abs(value) == HUGE_VAL) {
        throw ParseError(ParseErrorKind::NonFiniteValue, row, raw);
    }
    if (!std::isfinite(value)) { throw ParseError(ParseErrorKind::NonFiniteValue, row, raw); }
    return value;
}

Sample
validated_sample(double time, double concentration, std::size_t row) {
    if (!std::isfinite(time) || !std::isfinite(concentration)) {
        std::ostringstream ss;
        ss << time << ", " << concentration;
        throw ParseError(ParseErrorKind::NonFiniteValue, row, ss.str());
    }
    if (time < 0.0) {
        std::ostringstream ss;
        ss << time;
        throw ParseError(ParseErrorKind::NegativeTime, row, ss.str());
    }
    return Sample{ time, concentration };
}

} // namespace

std::vector<RawPair>
split_table(const std::string &text, const NormalizerOptions &options) {
    std::vector<RawPair> rows;
    std::istringstream input(text);
    std::string line;
    bool header_pending = options.skip_header;

    while (std::getline(input, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == options.comment_char) { continue; }
        if (header_pending) {
            header_pending = false;
            continue;
        }

        std::vector<std::string> fields = split_fields(trimmed, options.delimiter);
        if (fields.size() != 2) { throw ParseError(ParseErrorKind::FieldCount, rows.size(), trimmed); }
        rows.push_back(RawPair{ fields[0], fields[1] });
    }
    return rows;
}

SampleSet
normalize(const std::vector<RawPair> &raw_pairs) {
    std::vector<Sample> samples;
    samples.reserve(raw_pairs.size());
    for (std::size_t row = 0; row < raw_pairs.size(); ++row) {
        const double t = parse_field(raw_pairs[row].time, row);
        const double c = parse_field(raw_pairs[row].concentration, row);
        samples.push_back(validated_sample(t, c, row));
    }
    return SampleSet(std::move(samples));
}

SampleSet
normalize(const std::vector<std::pair<double, double>> &pairs) {
    std::vector<Sample> samples;
    samples.reserve(pairs.size());
    for (std::size_t row = 0; row < pairs.size(); ++row) {
        samples.push_back(validated_sample(pairs[row].first, pairs[row].second, row));
    }
    return SampleSet(std::move(samples));
}

SampleSet
normalize(const std::vector<double> &times, const std::vector<double> &concentrations) {
    if (times.size() != concentrations.size()) {
        throw ParseError(ParseErrorKind::ColumnMismatch,
                         ParseError::npos,
                         std::to_string(times.size()) + " times vs " + std::to_string(concentrations.size()) +
                           " concentrations");
    }
    std::vector<std::pair<double, double>> pairs;
    pairs.reserve(times.size());
    for (std::size_t i = 0; i < times.size(); ++i) { pairs.emplace_back(times[i], concentrations[i]); }
    return normalize(pairs);
}

SampleSet
normalize(const std::vector<std::string> &times, const std::vector<std::string> &concentrations) {
    if (times.size() != concentrations.size()) {
        throw ParseError(ParseErrorKind::ColumnMismatch,
                         ParseError::npos,
                         std::to_string(times.size()) + " times vs " + std::to_string(concentrations.size()) +
                           " concentrations");
    }
    std::vector<RawPair> raw_pairs;
    raw_pairs.reserve(times.size());
    for (std::size_t i = 0; i < times.size(); ++i) { raw_pairs.push_back(RawPair{ times[i], concentrations[i] }); }
    return normalize(raw_pairs);
}

SampleSet
parse_samples(const std::string &text, const NormalizerOptions &options) {
    return normalize(split_table(text, options));
}

} // namespace rate_order
