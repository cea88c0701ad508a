/**
 * @file units.hpp
 * @brief Unit token table and conversion to canonical units
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace MineSpec {

/**
 * @brief value_in_unit = value_in_token * factor
 */
struct UnitConversion {
    std::string token;
    std::string unit;
    double factor = 1.0;
};

/**
 * @brief Maps unit tokens as written in documents to canonical units
 *
 * One token may convert to several canonical units ("mm" to m and to mm,
 * "bar" to bar and to kPa); the parameter decides which one applies.
 */
class UnitTable {
public:
    static UnitTable builtin();

    static const std::vector<std::string>& canonical_units();
    static bool is_canonical(std::string_view unit);

    /**
     * @brief Lowercase, trim, collapse spaces, drop a trailing period
     */
    static std::string normalize_token(std::string_view token);

    /**
     * @brief Add or replace the conversion for (token, unit)
     * @throws std::invalid_argument for a non-positive factor or non-canonical unit
     */
    void set(const UnitConversion& conversion);

    std::optional<double> factor(std::string_view token, std::string_view unit) const;

    bool recognizes(std::string_view token) const;

    /**
     * @brief Longest known token at the start of text, ending on a word boundary
     * @return (normalized token, characters consumed)
     */
    std::optional<std::pair<std::string, size_t>> match_prefix(std::string_view text) const;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::pair<std::string, std::string>, double> entries_;
    std::vector<std::string> tokens_by_length_; // longest first
    std::set<std::string> tokens_;
};

} // namespace MineSpec
