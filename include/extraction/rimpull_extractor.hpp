/**
 * @file rimpull_extractor.hpp
 * @brief Gear / speed / force tables to rimpull curves
 */

#pragma once

#include <core/types.hpp>
#include <core/units.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MineSpec {

/**
 * @brief Column layout of a detected rimpull table
 */
struct RimpullLayout {
    size_t header_row = 0;
    size_t gear_col = 0;
    size_t speed_col = 0;
    size_t force_col = 0;
    std::string speed_token = "km/h";
    std::string force_token = "kn";
};

class RimpullExtractor {
public:
    static constexpr double MAX_SPEED_KPH = 80.0;
    static constexpr double MAX_FORCE_KN = 3000.0;

    explicit RimpullExtractor(UnitTable units);

    /**
     * @brief Header row (one of the first three) naming gear, speed and force, in any order
     */
    std::optional<RimpullLayout> detect(const Table& table) const;

    /**
     * @brief Parse every usable row; rows that do not parse or are out of range are skipped
     * @return nullopt when the table is not a rimpull table or no row survives
     */
    std::optional<RimpullCurve> extract(const Table& table, const std::string& brand,
                                        const std::string& model, const std::string& url) const;

    /**
     * @brief "1st", "F1", "gear 2", "third", "low", "R", "reverse 2" ...
     * @return Gear number, negative for reverse
     */
    static std::optional<int> parse_gear(std::string_view cell);

    /**
     * @brief Sort points by gear then speed and describe rows where force rises with speed
     */
    static std::vector<std::string> order_and_check(std::vector<RimpullPoint>& points);

private:
    std::optional<double> parse_measure(std::string_view cell, const std::string& default_token,
                                        const std::string& unit) const;

    UnitTable units_;
};

} // namespace MineSpec
