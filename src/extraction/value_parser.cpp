/**
 * @file value_parser.cpp
 * @brief Number, unit and label parsing
 */

#include <extraction/value_parser.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <set>
#include <sstream>
#include <vector>

namespace MineSpec {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Latin-1 supplement letters (second byte after 0xC3) folded to ASCII
char fold_c3(unsigned char b) {
    static const char* table =
        "AAAAAAACEEEEIIII"  // 0x80 - 0x8F
        "DNOOOOO*OUUUUYTs"  // 0x90 - 0x9F
        "aaaaaaaceeeeiiii"  // 0xA0 - 0xAF
        "dnooooo/ouuuuyty"; // 0xB0 - 0xBF
    if (b < 0x80 || b > 0xBF) return 0;
    return table[b - 0x80];
}

// Bounded: at most 1+3+4*4+7 characters for the grouped form, 1+12+7 otherwise.
const std::regex& number_regex() {
    static const std::regex re(
        R"(^(-?)(?:(\d{1,3}(?:[,.' ]\d{3}(?!\d)){1,4}(?:[.,]\d{1,6})?)|(\d{1,12}(?:[.,]\d{1,6})?)))",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

double to_double(std::string digits, bool grouped) {
    digits.erase(std::remove_if(digits.begin(), digits.end(),
                                [](char c) { return c == ' ' || c == '\''; }),
                 digits.end());

    size_t dots = std::count(digits.begin(), digits.end(), '.');
    size_t commas = std::count(digits.begin(), digits.end(), ',');

    // The plain form has at most one separator, always decimal. In the grouped
    // form the last separator is decimal unless exactly three digits follow it.
    char decimal = 0;
    if (dots + commas > 0) {
        size_t last = digits.find_last_of(".,");
        if ((dots && commas) || !grouped || digits.size() - last - 1 != 3) decimal = digits[last];
    }

    std::string clean;
    clean.reserve(digits.size());
    for (size_t i = 0; i < digits.size(); ++i) {
        char c = digits[i];
        if (c == '.' || c == ',') {
            if (c == decimal && i == digits.find_last_of(decimal)) clean.push_back('.');
            continue;
        }
        clean.push_back(c);
    }
    return std::strtod(clean.c_str(), nullptr);
}

const std::set<std::string>& unit_stopwords() {
    static const std::set<std::string> words = {
        "at", "and", "to", "with", "or", "for", "in", "on", "of", "from", "the", "a", "an",
        "y", "de", "con", "und", "bei", "et", "avec", "max", "min", "approx", "gross", "net"};
    return words;
}

} // namespace

std::string normalize_text(std::string_view text, size_t max_length) {
    size_t n = std::min(text.size(), max_length);
    // Do not cut a multi-byte sequence in half
    while (n > 0 && n < text.size() && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) --n;

    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == '\n') {
            out.push_back('\n');
        } else if (c < 0x20 || c == 0x7F) {
            out.push_back(c == '\r' ? '\n' : ' ');
        } else if (c == 0xC2 && i + 1 < n) {
            unsigned char d = static_cast<unsigned char>(text[i + 1]);
            switch (d) {
                case 0xA0: out.push_back(' '); ++i; break;             // no-break space
                case 0xB2: out.push_back('2'); ++i; break;             // superscript two
                case 0xB3: out.push_back('3'); ++i; break;             // superscript three
                case 0xAD: ++i; break;                                 // soft hyphen
                case 0xBA: case 0xAA: out.push_back(' '); ++i; break;  // ordinal indicators
                default:
                    if (d >= 0x80 && d <= 0x9F) {                      // C1 controls
                        out.push_back(' ');
                        ++i;
                    } else {
                        out.push_back(static_cast<char>(c));
                    }
            }
        } else if (c == 0xC3 && i + 1 < n && fold_c3(static_cast<unsigned char>(text[i + 1]))) {
            out.push_back(fold_c3(static_cast<unsigned char>(text[i + 1])));
            ++i;
        } else if (c == 0xE2 && i + 2 < n && static_cast<unsigned char>(text[i + 1]) == 0x80) {
            unsigned char d = static_cast<unsigned char>(text[i + 2]);
            if (d >= 0x90 && d <= 0x95) {          // hyphens and dashes
                out.push_back('-');
                i += 2;
            } else if (d >= 0x8B && d <= 0x8F) {   // zero width characters
                i += 2;
            } else if (d == 0xAF || (d >= 0x80 && d <= 0x8A)) { // special spaces
                out.push_back(' ');
                i += 2;
            } else {
                out.push_back(static_cast<char>(c));
            }
        } else if (c == 0xE2 && i + 2 < n && static_cast<unsigned char>(text[i + 1]) == 0x88 &&
                   static_cast<unsigned char>(text[i + 2]) == 0x92) {
            out.push_back('-'); // minus sign
            i += 2;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string trim_copy(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && is_space(text[b])) ++b;
    while (e > b && is_space(text[e - 1])) --e;
    return std::string(text.substr(b, e - b));
}

std::optional<ParsedNumber> parse_number_prefix(std::string_view text) {
    std::string_view head = text.substr(0, std::min<size_t>(text.size(), 40));
    std::cmatch m;
    if (!std::regex_search(head.data(), head.data() + head.size(), m, number_regex(),
                           std::regex_constants::match_continuous)) {
        return std::nullopt;
    }

    bool grouped = m[2].matched;
    double value = to_double(grouped ? m[2].str() : m[3].str(), grouped);
    if (m[1].length() > 0) value = -value;

    return ParsedNumber{value, static_cast<size_t>(m.length(0))};
}

std::optional<Quantity> parse_quantity(std::string_view text, const UnitTable& units,
                                       size_t max_prelude) {
    size_t limit = std::min(text.size(), max_prelude + 1);
    size_t start = std::string_view::npos;

    // "Tier-4", "C175-20": digits joined to a word by '-' or '/' belong to it
    auto joined = [&](size_t i) {
        return i >= 2 && (text[i - 1] == '-' || text[i - 1] == '/') && is_alnum(text[i - 2]);
    };

    for (size_t i = 0; i < limit; ++i) {
        char c = text[i];
        bool digit_start = is_digit(c) && (i == 0 || !is_alpha(text[i - 1])) && !joined(i);
        bool sign_start = c == '-' && i + 1 < text.size() && is_digit(text[i + 1]) &&
                          (i == 0 || !is_alnum(text[i - 1]));
        if (digit_start || sign_start) {
            start = i;
            break;
        }
        if (is_digit(c)) {
            // Digit inside a word such as "C18": skip the whole token
            while (i + 1 < limit && (is_alnum(text[i + 1]) || joined(i + 2))) ++i;
        }
    }
    if (start == std::string_view::npos) return std::nullopt;

    auto number = parse_number_prefix(text.substr(start));
    if (!number) return std::nullopt;

    Quantity q;
    q.value = number->value;
    q.begin = start;
    size_t pos = start + number->length;

    auto skip_spaces = [&](size_t p, size_t max) {
        size_t n = 0;
        while (p < text.size() && n < max && (text[p] == ' ' || text[p] == '\t')) {
            ++p;
            ++n;
        }
        return p;
    };

    // Range "a - b" / "a to b": keep the first value, consume the second
    {
        size_t p = skip_spaces(pos, 2);
        std::string_view rest = text.substr(p);
        size_t sep = 0;
        if (!rest.empty() && rest[0] == '-') sep = 1;
        else if (rest.size() > 2 && to_lower_ascii(rest.substr(0, 2)) == "to" && rest[2] == ' ') sep = 2;
        else if (rest.size() > 3 && to_lower_ascii(rest.substr(0, 3)) == "bis" && rest[3] == ' ') sep = 3;
        if (sep) {
            size_t q2 = skip_spaces(p + sep, 2);
            if (q2 < text.size() && is_digit(text[q2])) {
                if (auto second = parse_number_prefix(text.substr(q2))) pos = q2 + second->length;
            }
        }
    }

    size_t unit_pos = skip_spaces(pos, 2);
    q.end = pos;
    if (unit_pos < text.size()) {
        std::string_view rest = text.substr(unit_pos, std::min<size_t>(24, text.size() - unit_pos));
        if (auto match = units.match_prefix(rest)) {
            q.unit_token = match->first;
            q.unit_known = true;
            q.end = unit_pos + match->second;
        } else if (is_alpha(rest.front())) {
            size_t len = 0;
            while (len < rest.size() && len < 12 && (is_alpha(rest[len]) || rest[len] == '/')) ++len;
            std::string word = to_lower_ascii(rest.substr(0, len));
            if (!unit_stopwords().count(word)) {
                q.unit_token = word;
                q.end = unit_pos + len;
            }
        }
    }

    // Unit hint "(kg)" in the prelude
    if (q.unit_token.empty() && start > 0) {
        std::string_view prelude = text.substr(0, start);
        size_t open = prelude.rfind('(');
        size_t close = prelude.rfind(')');
        if (open != std::string_view::npos && close != std::string_view::npos && close > open + 1) {
            std::string_view inside = prelude.substr(open + 1, close - open - 1);
            std::string token = UnitTable::normalize_token(inside);
            if (units.recognizes(token)) {
                q.unit_token = token;
                q.unit_known = true;
            }
        }
    }

    return q;
}

bool is_placeholder(std::string_view cell) {
    std::string t = to_lower_ascii(trim_copy(cell));
    if (t.empty()) return true;

    bool only_marks = std::all_of(t.begin(), t.end(), [](char c) {
        return c == '-' || c == '*' || c == '.' || c == '?' || c == '/' || c == ' ' || c == '_' || c == 'x';
    });
    if (only_marks) return true;

    static const std::set<std::string> words = {
        "n/a", "na", "n.a.", "n.a", "n/d", "nd", "tbd", "tba", "tbc", "pending", "ask",
        "none", "null", "nil", "nan", "0", "0.0", "not available", "not applicable", "unknown",
        "contact dealer", "consult dealer", "contact factory", "on request", "upon request",
        "available", "optional", "option", "standard", "std", "varies", "see note",
        "consultar", "a consultar", "opcional", "no disponible", "sin dato", "auf anfrage"};
    return words.count(t) > 0;
}

NormalizedLabel normalize_label(std::string_view cell) {
    NormalizedLabel out;
    std::string text = to_lower_ascii(normalize_text(cell, 256));

    size_t open = text.find('(');
    while (open != std::string::npos) {
        size_t close = text.find(')', open);
        if (close == std::string::npos) {
            text.erase(open);
            break;
        }
        if (out.unit_hint.empty()) out.unit_hint = UnitTable::normalize_token(text.substr(open + 1, close - open - 1));
        text.erase(open, close - open + 1);
        open = text.find('(');
    }

    std::string key;
    bool space = false;
    for (char c : text) {
        bool keep = is_alnum(c) || c == '\'';
        if (!keep) {
            space = !key.empty();
            continue;
        }
        if (space) {
            key.push_back(' ');
            space = false;
        }
        key.push_back(c);
    }
    out.key = key;
    return out;
}

std::string strip_qualifiers(const std::string& key) {
    static const std::set<std::string> qualifiers = {
        "max", "maximum", "min", "minimum", "rated", "nominal", "total", "approx",
        "approximate", "approximately", "typical", "standard", "std", "ca", "maximo", "maxima",
        "aprox", "gesamt"};
    std::istringstream iss(key);
    std::string word;
    std::string out;
    while (iss >> word) {
        if (qualifiers.count(word)) continue;
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

} // namespace MineSpec
