#ifndef DATASET_NORMALIZER_HPP
#define DATASET_NORMALIZER_HPP

#include "kinetics_errors.hpp"
#include "sample_set.hpp"
#include <string>
#include <utility>
#include <vector>

namespace rate_order {

/**
 * @brief Field separator of a pasted or loaded data table.
 */
enum class Delimiter {
    Comma,
    Tab,
    Whitespace ///< Any run of spaces and tabs.
};

/**
 * @brief Options controlling how raw table text is split into rows.
 */
struct NormalizerOptions {
    Delimiter delimiter = Delimiter::Comma;
    bool skip_header = false; ///< Drop the first non-comment line (column titles).
    char comment_char = '#';  ///< Lines starting with this character are ignored.
};

/**
 * @brief One unparsed (time, concentration) row as entered by the user.
 */
struct RawPair {
    std::string time;
    std::string concentration;
};

/**
 * @brief Splits table text into raw field pairs.
 *
 * Blank and comment lines are skipped. Every remaining line must hold exactly
 * two fields.
 *
 * @throws ParseError (FieldCount) naming the data row and the offending line.
 */
std::vector<RawPair>
split_table(const std::string &text, const NormalizerOptions &options = {});

/**
 * @brief Parses and validates raw pairs into a time-ordered SampleSet.
 *
 * The batch is rejected as a whole on the first malformed field.
 * @throws ParseError identifying the row and the offending token.
 */
SampleSet
normalize(const std::vector<RawPair> &raw_pairs);

/**
 * @brief Validates numeric pairs (time, concentration) into a SampleSet.
 * @throws ParseError on non-finite values or negative time.
 */
SampleSet
normalize(const std::vector<std::pair<double, double>> &pairs);

/**
 * @brief Column form: separate time and concentration vectors.
 * @throws ParseError (ColumnMismatch) if the columns differ in length.
 */
SampleSet
normalize(const std::vector<double> &times, const std::vector<double> &concentrations);

/**
 * @brief Column form for unparsed text fields.
 * @throws ParseError (ColumnMismatch) if the columns differ in length.
 */
SampleSet
normalize(const std::vector<std::string> &times, const std::vector<std::string> &concentrations);

/**
 * @brief Convenience: split_table followed by normalize.
 */
SampleSet
parse_samples(const std::string &text, const NormalizerOptions &options = {});

} // namespace rate_order

#endif // DATASET_NORMALIZER_HPP
