/**
 * @file value_parser.hpp
 * @brief Text normalization and bounded number/unit parsing
 */

#pragma once

#include <core/units.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace MineSpec {

/**
 * @brief Prepare document text for matching
 *
 * Truncates to max_length bytes on a UTF-8 boundary, turns control
 * characters into spaces, folds Latin accents and typographic dashes to
 * ASCII and maps superscript 2/3 to digits. The output is never longer
 * than the input.
 */
std::string normalize_text(std::string_view text, size_t max_length);

std::string to_lower_ascii(std::string_view text);

std::string trim_copy(std::string_view text);

/**
 * @brief A number parsed from the start of some text
 */
struct ParsedNumber {
    double value = 0.0;
    size_t length = 0; // characters consumed
};

/**
 * @brief Parse one number at the start of text
 *
 * Accepts a leading '-', thousands separators (',' '.' ' ' '\'') in groups
 * of three and a decimal point or comma.
 */
std::optional<ParsedNumber> parse_number_prefix(std::string_view text);

/**
 * @brief A number with its trailing unit token
 */
struct Quantity {
    double value = 0.0;
    std::string unit_token; // normalized; empty when none was written
    bool unit_known = false;
    size_t begin = 0;       // offset of the number
    size_t end = 0;         // offset just past the unit (or number)
};

/**
 * @brief Find the first quantity in text
 *
 * The number must start within max_prelude characters and not inside a
 * word ("C18"). For ranges the first value is returned. A unit written in
 * parentheses before the number ("weight (kg): 180 000") is used when none
 * follows it.
 */
std::optional<Quantity> parse_quantity(std::string_view text, const UnitTable& units,
                                       size_t max_prelude);

/**
 * @brief Cells such as "-", "N/A", "TBD" or "contact dealer" that carry no value
 */
bool is_placeholder(std::string_view cell);

/**
 * @brief Table label normalization
 *
 * Lowercase, unit hint in parentheses split out, punctuation to spaces,
 * whitespace collapsed.
 */
struct NormalizedLabel {
    std::string key;
    std::string unit_hint;
};

NormalizedLabel normalize_label(std::string_view cell);

/**
 * @brief Remove qualifier words ("max", "rated", "approx", ...) from a label key
 */
std::string strip_qualifiers(const std::string& key);

} // namespace MineSpec
