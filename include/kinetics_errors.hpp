#ifndef KINETICS_ERRORS_HPP
#define KINETICS_ERRORS_HPP

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace rate_order {

/**
 * @brief Category of a ParseError.
 */
enum class ParseErrorKind {
    MalformedNumber, ///< Field is not a complete real-number token.
    NonFiniteValue,  ///< Field parsed as nan or inf.
    NegativeTime,    ///< Time field is below zero.
    FieldCount,      ///< A table line does not hold exactly two fields.
    ColumnMismatch   ///< Time and concentration columns differ in length.
};

std::string
to_string(ParseErrorKind kind);

/**
 * @brief Raised when raw input cannot be turned into a SampleSet.
 *
 * The whole batch is rejected; row() identifies the first offending data row
 * (0-based) or is ParseError::npos for column-level errors.
 */
class ParseError : public std::runtime_error {
  public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    ParseError(ParseErrorKind kind, std::size_t row, std::string raw_text);

    ParseErrorKind kind() const { return kind_; }
    std::size_t row() const { return row_; }
    const std::string &raw_text() const { return raw_text_; }

  private:
    ParseErrorKind kind_;
    std::size_t row_;
    std::string raw_text_;
};

/**
 * @brief Raised when fewer than two samples are available for evaluation.
 */
class InsufficientDataError : public std::runtime_error {
  public:
    explicit InsufficientDataError(std::size_t sample_count);

    std::size_t sample_count() const { return sample_count_; }

  private:
    std::size_t sample_count_;
};

} // namespace rate_order

#endif // KINETICS_ERRORS_HPP
