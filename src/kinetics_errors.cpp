#include "kinetics_errors.hpp"
#include <sstream>
#include <utility>

namespace rate_order {

namespace {

std::string
parse_error_message(ParseErrorKind kind, std::size_t row, const std::string &raw_text) {
    std::ostringstream ss;
    ss << "Parse error (" << to_string(kind) << ")";
    if (row != ParseError::npos) { ss << " at row " << row; }
    if (!raw_text.empty()) { ss << ": '" << raw_text << "'"; }
    return ss.str();
}

} // namespace

std::string
to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MalformedNumber:
            return "malformed number";
        case ParseErrorKind::NonFiniteValue:
            return "non-finite value";
        case ParseErrorKind::NegativeTime:
            return "negative time";
        case ParseErrorKind::FieldCount:
            return "wrong field count";
        case ParseErrorKind::ColumnMismatch:
            return "column mismatch";
    }
    return "unknown";
}

ParseError::ParseError(ParseErrorKind kind, std::size_t row, std::string raw_text)
  : std::runtime_error(parse_error_message(kind, row, raw_text))
  , kind_(kind)
  , row_(row)
  , raw_text_(std::move(raw_text)) {}

InsufficientDataError::InsufficientDataError(std::size_t sample_count)
  : std::runtime_error("Insufficient data: at least 2 samples are required, got " + std::to_string(sample_count))
  , sample_count_(sample_count) {}

} // namespace rate_order
