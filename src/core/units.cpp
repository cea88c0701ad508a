/**
 * @file units.cpp
 * @brief Built-in unit conversions
 */

#include <core/units.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace MineSpec {

namespace {

struct Row {
    const char* token;
    const char* unit;
    double factor;
};

const Row BUILTIN[] = {
    // Mass, canonical kg. "ton" is read as metric in this trade.
    {"kg", "kg", 1.0}, {"kgs", "kg", 1.0}, {"kilograms", "kg", 1.0}, {"kilos", "kg", 1.0},
    {"t", "kg", 1000.0}, {"ton", "kg", 1000.0}, {"tons", "kg", 1000.0},
    {"tonne", "kg", 1000.0}, {"tonnes", "kg", 1000.0}, {"metric ton", "kg", 1000.0},
    {"metric tons", "kg", 1000.0}, {"toneladas", "kg", 1000.0}, {"tonelada", "kg", 1000.0},
    {"short ton", "kg", 907.18474}, {"short tons", "kg", 907.18474},
    {"lb", "kg", 0.45359237}, {"lbs", "kg", 0.45359237}, {"pounds", "kg", 0.45359237},

    // Power, canonical kW
    {"kw", "kW", 1.0}, {"mw", "kW", 1000.0}, {"hp", "kW", 0.745699872}, {"bhp", "kW", 0.745699872},
    {"ps", "kW", 0.73549875}, {"cv", "kW", 0.73549875},

    // Torque, canonical Nm
    {"nm", "Nm", 1.0}, {"n·m", "Nm", 1.0}, {"n.m", "Nm", 1.0}, {"n-m", "Nm", 1.0},
    {"knm", "Nm", 1000.0}, {"kn·m", "Nm", 1000.0}, {"kn.m", "Nm", 1000.0}, {"kn-m", "Nm", 1000.0},
    {"lb-ft", "Nm", 1.3558179}, {"lb·ft", "Nm", 1.3558179}, {"lb ft", "Nm", 1.3558179},
    {"lbf-ft", "Nm", 1.3558179}, {"lbf·ft", "Nm", 1.3558179}, {"ft-lb", "Nm", 1.3558179},
    {"ft·lb", "Nm", 1.3558179},

    // Volume, canonical L and m3
    {"l", "L", 1.0}, {"liters", "L", 1.0}, {"litres", "L", 1.0}, {"liter", "L", 1.0},
    {"litre", "L", 1.0}, {"litros", "L", 1.0}, {"litro", "L", 1.0},
    {"cc", "L", 0.001}, {"cm3", "L", 0.001}, {"gal", "L", 3.785411784}, {"gallons", "L", 3.785411784},
    {"gallon", "L", 3.785411784}, {"us gal", "L", 3.785411784}, {"m3", "L", 1000.0},
    {"m3", "m3", 1.0}, {"cu m", "m3", 1.0}, {"cu. m", "m3", 1.0}, {"cubic meters", "m3", 1.0},
    {"cubic metres", "m3", 1.0}, {"yd3", "m3", 0.764554858}, {"cu yd", "m3", 0.764554858},
    {"cu. yd", "m3", 0.764554858}, {"cubic yards", "m3", 0.764554858},
    {"ft3", "m3", 0.0283168466}, {"cu ft", "m3", 0.0283168466},

    // Speed, canonical km/h
    {"km/h", "km/h", 1.0}, {"kmh", "km/h", 1.0}, {"kph", "km/h", 1.0}, {"km/hr", "km/h", 1.0},
    {"mph", "km/h", 1.609344},

    // Rotation, canonical rpm
    {"rpm", "rpm", 1.0}, {"r/min", "rpm", 1.0}, {"min-1", "rpm", 1.0}, {"u/min", "rpm", 1.0},

    // Length, canonical m and mm
    {"m", "m", 1.0}, {"meters", "m", 1.0}, {"metres", "m", 1.0}, {"metros", "m", 1.0},
    {"mm", "m", 0.001}, {"cm", "m", 0.01}, {"ft", "m", 0.3048}, {"feet", "m", 0.3048},
    {"foot", "m", 0.3048}, {"in", "m", 0.0254}, {"inch", "m", 0.0254}, {"inches", "m", 0.0254},
    {"mm", "mm", 1.0}, {"cm", "mm", 10.0}, {"m", "mm", 1000.0}, {"in", "mm", 25.4},
    {"inch", "mm", 25.4}, {"inches", "mm", 25.4},

    // Force, canonical kN
    {"kn", "kN", 1.0}, {"kgf", "kN", 0.00980665}, {"lbf", "kN", 0.0044482216},
    {"lb", "kN", 0.0044482216}, {"lbs", "kN", 0.0044482216}, {"tf", "kN", 9.80665},

    // Pressure, canonical bar (hydraulics) and kPa (ground)
    {"bar", "bar", 1.0}, {"psi", "bar", 0.0689475729}, {"mpa", "bar", 10.0},
    {"kpa", "bar", 0.01}, {"kg/cm2", "bar", 0.980665},
    {"kpa", "kPa", 1.0}, {"bar", "kPa", 100.0}, {"psi", "kPa", 6.89475729},
    {"kg/cm2", "kPa", 98.0665}, {"mpa", "kPa", 1000.0},

    // Flow, canonical L/min and L/h
    {"l/min", "L/min", 1.0}, {"lpm", "L/min", 1.0}, {"gpm", "L/min", 3.785411784},
    {"gal/min", "L/min", 3.785411784},
    {"l/h", "L/h", 1.0}, {"lph", "L/h", 1.0}, {"l/hr", "L/h", 1.0}, {"gal/h", "L/h", 3.785411784},
    {"gph", "L/h", 3.785411784}, {"gal/hr", "L/h", 3.785411784},

    // Ratio and electrical
    {"%", "%", 1.0}, {"percent", "%", 1.0}, {"pct", "%", 1.0},
    {"v", "V", 1.0}, {"volt", "V", 1.0}, {"volts", "V", 1.0}, {"vdc", "V", 1.0},
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const std::vector<std::string>& UnitTable::canonical_units() {
    static const std::vector<std::string> units = {
        "kg", "kW", "Nm", "L", "m3", "km/h", "rpm", "m", "mm", "kN",
        "bar", "L/min", "L/h", "kPa", "%", "V"};
    return units;
}

bool UnitTable::is_canonical(std::string_view unit) {
    const auto& u = canonical_units();
    return std::find(u.begin(), u.end(), unit) != u.end();
}

std::string UnitTable::normalize_token(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    bool pending_space = false;
    for (char c : token) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (out.size() > 1 && out.back() == '.') out.pop_back();
    return out;
}

UnitTable UnitTable::builtin() {
    UnitTable table;
    for (const auto& row : BUILTIN) {
        table.set({row.token, row.unit, row.factor});
    }
    return table;
}

void UnitTable::set(const UnitConversion& conversion) {
    if (!(conversion.factor > 0.0)) {
        throw std::invalid_argument("Unit factor must be positive for token '" + conversion.token + "'");
    }
    if (!is_canonical(conversion.unit)) {
        throw std::invalid_argument("Unknown canonical unit '" + conversion.unit + "'");
    }
    std::string token = normalize_token(conversion.token);
    if (token.empty()) {
        throw std::invalid_argument("Empty unit token");
    }

    entries_[{token, conversion.unit}] = conversion.factor;
    if (tokens_.insert(token).second) {
        tokens_by_length_.push_back(token);
        std::stable_sort(tokens_by_length_.begin(), tokens_by_length_.end(),
                         [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    }
}

std::optional<double> UnitTable::factor(std::string_view token, std::string_view unit) const {
    auto it = entries_.find({normalize_token(token), std::string(unit)});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool UnitTable::recognizes(std::string_view token) const {
    return tokens_.count(normalize_token(token)) > 0;
}

std::optional<std::pair<std::string, size_t>> UnitTable::match_prefix(std::string_view text) const {
    for (const auto& token : tokens_by_length_) {
        if (token.size() > text.size()) continue;

        bool same = true;
        for (size_t i = 0; i < token.size(); ++i) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
            if (c != token[i]) {
                same = false;
                break;
            }
        }
        if (!same) continue;

        // "m" must not match the start of "meters" left for a longer token,
        // nor "t" the start of "to".
        if (token.size() < text.size() && is_word_char(token.back()) && is_word_char(text[token.size()])) {
            continue;
        }
        return std::make_pair(token, token.size());
    }
    return std::nullopt;
}

} // namespace MineSpec
