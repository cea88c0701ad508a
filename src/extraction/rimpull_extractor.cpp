/**
 * @file rimpull_extractor.cpp
 * @brief Rimpull table detection and parsing
 */

#include <extraction/rimpull_extractor.hpp>
#include <extraction/value_parser.hpp>
#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>

namespace MineSpec {

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

bool is_gear_header(const std::string& h) {
    return contains_any(h, {"gear", "marcha", "gang", "rapport", "cambio"});
}

bool is_force_header(const std::string& h) {
    return contains_any(h, {"rimpull", "force", "tractive", "pull", "fuerza", "traccion",
                            "zugkraft", "effort", "(kn)", "(lbf)", "(kgf)"});
}

bool is_speed_header(const std::string& h) {
    return contains_any(h, {"speed", "velocidad", "geschwindigkeit", "vitesse", "km/h", "mph", "kmh"});
}

std::string header_speed_token(const std::string& h) {
    return h.find("mph") != std::string::npos ? "mph" : "km/h";
}

std::string header_force_token(const std::string& h) {
    if (h.find("lbf") != std::string::npos || h.find("(lb") != std::string::npos ||
        h.find(" lb") != std::string::npos) return "lbf";
    if (h.find("kgf") != std::string::npos) return "kgf";
    if (h.find("(tf)") != std::string::npos || h.find(" tf") != std::string::npos) return "tf";
    return "kn";
}

} // namespace

RimpullExtractor::RimpullExtractor(UnitTable units) : units_(std::move(units)) {}

std::optional<RimpullLayout> RimpullExtractor::detect(const Table& table) const {
    size_t rows = std::min<size_t>(table.size(), 3);
    for (size_t r = 0; r < rows; ++r) {
        std::optional<size_t> gear, speed, force;
        RimpullLayout layout;
        layout.header_row = r;

        for (size_t c = 0; c < table[r].size(); ++c) {
            std::string h = to_lower_ascii(normalize_text(table[r][c], 128));
            // Gear wins over speed ("speed range"/"gear" both appear in some headers)
            if (!gear && is_gear_header(h) && !is_force_header(h)) {
                gear = c;
            } else if (!force && is_force_header(h)) {
                force = c;
                layout.force_token = header_force_token(h);
            } else if (!speed && is_speed_header(h)) {
                speed = c;
                layout.speed_token = header_speed_token(h);
            }
        }

        if (gear && speed && force) {
            layout.gear_col = *gear;
            layout.speed_col = *speed;
            layout.force_col = *force;
            return layout;
        }
    }
    return std::nullopt;
}

std::optional<int> RimpullExtractor::parse_gear(std::string_view cell) {
    std::string s = to_lower_ascii(trim_copy(normalize_text(cell, 32)));
    if (s.empty()) return std::nullopt;

    static const std::regex forward_number(
        R"(^(?:gear\s{0,2}|f\s{0,2}|marcha\s{0,2})?(\d{1,2})(?:st|nd|rd|th|a|o|\.)?(?:\s{0,2}(?:gear|f|fwd|forward|marcha))?$)");
    static const std::regex reverse_number(R"(^(?:r|rev|reverse|reversa|ruckwarts)\.?\s{0,2}(\d)?$)");
    static const std::vector<std::pair<std::string, int>> words = {
        {"first", 1}, {"second", 2}, {"third", 3}, {"fourth", 4}, {"fifth", 5}, {"sixth", 6},
        {"seventh", 7}, {"eighth", 8}, {"low", 1}, {"primera", 1}, {"segunda", 2}, {"tercera", 3}};

    std::smatch m;
    if (std::regex_match(s, m, forward_number)) {
        int g = std::stoi(m[1].str());
        if (g >= 1 && g <= 20) return g;
        return std::nullopt;
    }
    if (std::regex_match(s, m, reverse_number)) {
        int g = m[1].matched ? std::stoi(m[1].str()) : 1;
        if (g >= 1) return -g;
        return std::nullopt;
    }

    std::string word = s;
    if (word.size() > 5 && word.compare(word.size() - 5, 5, " gear") == 0) word.resize(word.size() - 5);
    for (const auto& [name, gear] : words) {
        if (word == name) return gear;
    }
    return std::nullopt;
}

std::optional<double> RimpullExtractor::parse_measure(std::string_view cell,
                                                      const std::string& default_token,
                                                      const std::string& unit) const {
    std::string text = normalize_text(cell, 64);
    if (is_placeholder(text)) return std::nullopt;

    auto q = parse_quantity(text, units_, 4);
    if (!q) return std::nullopt;

    const std::string& token = q->unit_known ? q->unit_token : default_token;
    auto factor = units_.factor(token, unit);
    if (!factor) return std::nullopt;
    return q->value * *factor;
}

std::vector<std::string> RimpullExtractor::order_and_check(std::vector<RimpullPoint>& points) {
    std::stable_sort(points.begin(), points.end(), [](const RimpullPoint& a, const RimpullPoint& b) {
        if (a.gear != b.gear) return a.gear < b.gear;
        return a.speed_kph < b.speed_kph;
    });

    std::vector<std::string> violations;
    for (size_t i = 1; i < points.size(); ++i) {
        const auto& prev = points[i - 1];
        const auto& cur = points[i];
        if (prev.gear != cur.gear) continue;
        // Half a percent of slack for rounding in published tables
        if (cur.force_kn > prev.force_kn * 1.005 && cur.speed_kph > prev.speed_kph) {
            std::ostringstream oss;
            oss << "gear " << cur.gear << ": force rises from " << prev.force_kn << " kN at "
                << prev.speed_kph << " km/h to " << cur.force_kn << " kN at " << cur.speed_kph << " km/h";
            violations.push_back(oss.str());
        }
    }
    return violations;
}

std::optional<RimpullCurve> RimpullExtractor::extract(const Table& table, const std::string& brand,
                                                      const std::string& model,
                                                      const std::string& url) const {
    auto layout = detect(table);
    if (!layout) return std::nullopt;

    RimpullCurve curve;
    curve.brand = brand;
    curve.model = model;
    curve.source_url = url;

    size_t needed = std::max({layout->gear_col, layout->speed_col, layout->force_col});
    for (size_t r = layout->header_row + 1; r < table.size(); ++r) {
        const auto& row = table[r];
        if (row.size() <= needed) continue;

        auto gear = parse_gear(row[layout->gear_col]);
        auto speed = parse_measure(row[layout->speed_col], layout->speed_token, "km/h");
        auto force = parse_measure(row[layout->force_col], layout->force_token, "kN");
        if (!gear || !speed || !force) continue;

        if (!(*speed > 0.0 && *speed <= MAX_SPEED_KPH)) continue;
        if (!(*force > 0.0 && *force <= MAX_FORCE_KN)) continue;

        curve.points.push_back({*gear, *speed, *force});
    }

    if (curve.points.empty()) return std::nullopt;
    curve.violations = order_and_check(curve.points);
    return curve;
}

} // namespace MineSpec
