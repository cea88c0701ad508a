/**
 * @file spec_extractor.cpp
 * @brief Prose and table matchers
 */

#include <extraction/spec_extractor.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace MineSpec {

namespace {

bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

std::string collapse_spaces(std::string_view s) {
    std::string out;
    bool space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (space) out.push_back(' ');
        space = false;
        out.push_back(c);
    }
    return out;
}

bool has_digit(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool all_numeric(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ',';
    });
}

// Engine model strings run into the following sentence; keep at most four
// tokens, stop at connecting words and at a bare number once the model
// designation has been seen. The first token must be a known engine make or
// carry a digit ("C18", "QSK60").
std::string clean_engine_model(const std::string& raw) {
    static const std::set<std::string> stop = {
        "with", "delivering", "rated", "and", "at", "producing", "that", "which", "is", "offers",
        "provides", "gross", "net", "power", "engine", "diesel", "con", "de", "mit"};
    static const std::set<std::string> makes = {
        "cat", "caterpillar", "cummins", "mtu", "komatsu", "detroit", "volvo", "deutz", "perkins",
        "mitsubishi", "isuzu", "scania", "mercedes", "mercedes-benz", "liebherr", "hino", "yanmar",
        "john", "deere", "weichai", "yuchai", "sdec", "man", "doosan", "hyundai", "kubota", "hitachi",
        "ymz", "tmz", "qsk"};

    std::string cut = raw;
    for (const char* sep : {". ", ", ", "; ", " - "}) {
        size_t p = cut.find(sep);
        if (p != std::string::npos) cut.resize(p);
    }

    std::istringstream iss(cut);
    std::string word;
    std::string out;
    int words = 0;
    while (iss >> word && words < 4) {
        std::string lower = to_lower_ascii(word);
        if (stop.count(lower)) break;
        if (words == 0 && !has_digit(word) && !makes.count(lower)) return {};
        if (words > 0 && all_numeric(word) && has_digit(out)) break;
        if (!out.empty()) out.push_back(' ');
        out += word;
        ++words;
    }
    while (!out.empty() && (out.back() == '.' || out.back() == '-' || out.back() == '/')) out.pop_back();

    return has_digit(out) ? out : std::string{};
}

std::optional<size_t> find_unit_column(const Table& table) {
    if (table.empty()) return std::nullopt;
    static const std::set<std::string> names = {"unit", "units", "uom", "unidad", "unidades", "einheit", "unite"};
    for (size_t c = 0; c < table[0].size(); ++c) {
        if (names.count(normalize_label(table[0][c]).key)) return c;
    }
    return std::nullopt;
}

double tidy(double v) {
    return std::round(v * 1e6) / 1e6;
}

} // namespace

SpecExtractor::SpecExtractor(const Settings& settings)
    : settings_(settings.extraction), units_(settings.units), rimpull_(settings.units) {
    for (const auto& param : ParameterCatalog::builtin().all()) {
        for (const auto& alias : param.aliases) {
            bool trailing = std::find(param.trailing_aliases.begin(), param.trailing_aliases.end(), alias) !=
                            param.trailing_aliases.end();
            anchors_.push_back({alias, &param, true, trailing});
            labels_.emplace(normalize_label(alias).key, &param);
        }
        for (const auto& alias : param.trailing_aliases) {
            if (std::find(param.aliases.begin(), param.aliases.end(), alias) != param.aliases.end()) continue;
            anchors_.push_back({alias, &param, false, true});
        }
        if (param.is_text()) {
            text_patterns_.emplace(param.name, std::regex(param.text_pattern, std::regex::ECMAScript | std::regex::optimize));
        }
    }
    std::stable_sort(anchors_.begin(), anchors_.end(), [](const Anchor& a, const Anchor& b) {
        return a.phrase.size() > b.phrase.size();
    });
}

ExtractionResult SpecExtractor::extract(const RawDocument& document, const std::string& brand,
                                        const std::string& model) const {
    ExtractionResult result;
    result.candidates = extract_text(document, brand, model);

    auto table_candidates = extract_tables(document, brand, model);
    result.candidates.insert(result.candidates.end(),
                             std::make_move_iterator(table_candidates.begin()),
                             std::make_move_iterator(table_candidates.end()));

    const ParameterSpec* rimpull_param = ParameterCatalog::builtin().find("max_rimpull_kn");
    for (size_t t = 0; t < document.tables.size(); ++t) {
        auto curve = rimpull_.extract(document.tables[t], brand, model, document.url);
        if (!curve) continue;

        auto top = std::max_element(curve->points.begin(), curve->points.end(),
                                    [](const RimpullPoint& a, const RimpullPoint& b) { return a.force_kn < b.force_kn; });

        ExtractionCandidate c = base_candidate(document, brand, model, *rimpull_param, ExtractionMethod::RimpullTable);
        std::ostringstream raw;
        raw << "rimpull table: gear " << top->gear << ", " << top->speed_kph << " km/h, " << top->force_kn << " kN";
        c.raw_match = raw.str();
        c.value = tidy(top->force_kn);
        c.unit = "kN";
        c.span.table = static_cast<int>(t);
        c.id = make_candidate_id(c.source_url, c.method, c.parameter, c.span, c.raw_match);
        result.candidates.push_back(std::move(c));

        if (!curve->monotonic()) {
            Logger::debug("Rimpull table " + std::to_string(t) + " in " + document.url + " has " +
                          std::to_string(curve->violations.size()) + " monotonicity violation(s)");
        }
        result.curves.push_back(std::move(*curve));
    }

    return result;
}

std::vector<SpecExtractor::Hit> SpecExtractor::find_anchors(const std::string& lower) const {
    std::vector<char> claimed(lower.size(), 0);
    std::vector<Hit> hits;

    for (const auto& anchor : anchors_) {
        size_t accepted = 0;
        size_t pos = 0;
        while (accepted < settings_.max_hits_per_anchor &&
               (pos = lower.find(anchor.phrase, pos)) != std::string::npos) {
            size_t end = pos + anchor.phrase.size();
            bool boundary = (pos == 0 || !is_alnum(lower[pos - 1])) &&
                            (end >= lower.size() || !is_alnum(lower[end]));
            bool free = boundary && std::none_of(claimed.begin() + pos, claimed.begin() + end,
                                                 [](char c) { return c != 0; });
            if (free) {
                std::fill(claimed.begin() + pos, claimed.begin() + end, 1);
                hits.push_back({pos, anchor.phrase.size(), &anchor});
                ++accepted;
                pos = end;
            } else {
                ++pos;
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) { return a.pos < b.pos; });
    return hits;
}

ExtractionCandidate SpecExtractor::base_candidate(const RawDocument& document, const std::string& brand,
                                                  const std::string& model, const ParameterSpec& param,
                                                  ExtractionMethod method) const {
    ExtractionCandidate c;
    c.brand = brand;
    c.model = model;
    c.parameter = param.name;
    c.method = method;
    c.source_url = document.url;
    return c;
}

bool SpecExtractor::make_numeric(const ParameterSpec& param, const Quantity& q, const std::string& hint,
                                 ExtractionCandidate& out) const {
    if (param.kind == ParameterKind::Count) {
        if (q.unit_known) return false;
        if (std::fabs(q.value - std::round(q.value)) > 1e-9) return false;
        out.value = std::round(q.value);
        out.unit.reset();
        return true;
    }

    std::string token = q.unit_token;
    bool known = q.unit_known;
    if (token.empty() && !hint.empty()) {
        token = hint;
        known = units_.recognizes(hint);
    }

    out.value = tidy(q.value);
    out.unit.reset();
    if (known) {
        if (auto factor = units_.factor(token, param.canonical_unit)) {
            out.value = tidy(q.value * *factor);
            out.unit = param.canonical_unit;
        }
    }
    return true;
}

std::optional<std::pair<size_t, size_t>> SpecExtractor::match_text_value(const ParameterSpec& param,
                                                                         std::string_view lower) const {
    auto it = text_patterns_.find(param.name);
    if (it == text_patterns_.end()) return std::nullopt;

    std::cmatch m;
    try {
        if (!std::regex_search(lower.data(), lower.data() + lower.size(), m, it->second)) return std::nullopt;
    } catch (const std::regex_error& e) {
        Logger::debug("Pattern for " + param.name + " failed: " + e.what());
        return std::nullopt;
    }

    size_t group = m[1].matched ? 1 : 0;
    size_t offset = static_cast<size_t>(m.position(group));
    if (offset > MAX_PRELUDE) return std::nullopt;
    return std::make_pair(offset, static_cast<size_t>(m.length(group)));
}

std::vector<ExtractionCandidate> SpecExtractor::extract_text(const RawDocument& document, const std::string& brand,
                                                             const std::string& model) const {
    std::vector<ExtractionCandidate> out;

    const std::string text = normalize_text(document.text, settings_.max_text_length);
    const std::string lower = to_lower_ascii(text);
    const auto hits = find_anchors(lower);

    for (size_t i = 0; i < hits.size(); ++i) {
        const Hit& hit = hits[i];
        const Anchor& anchor = *hit.anchor;
        const ParameterSpec& param = *anchor.param;

        size_t start = hit.pos + hit.len;
        size_t limit = i + 1 < hits.size() ? hits[i + 1].pos : lower.size();
        size_t end = std::min(start + WINDOW_AFTER, limit);

        ExtractionCandidate c = base_candidate(document, brand, model, param, ExtractionMethod::Regex);
        size_t raw_begin = hit.pos;
        size_t raw_end = start;
        bool found = false;

        if (anchor.trailing) {
            // "16 cylinders": up to three digits, at most two spaces before the phrase
            size_t floor = i > 0 ? hits[i - 1].pos + hits[i - 1].len : 0;
            size_t p = hit.pos;
            size_t spaces = 0;
            while (p > floor && text[p - 1] == ' ' && spaces < 2) {
                --p;
                ++spaces;
            }
            size_t digits_end = p;
            while (p > floor && digits_end - p < 3 && std::isdigit(static_cast<unsigned char>(text[p - 1]))) --p;
            if (p < digits_end && (p == 0 || !is_alnum(text[p - 1])) && hit.pos - p <= TRAILING_LOOKBACK) {
                c.value = std::stod(text.substr(p, digits_end - p));
                raw_begin = p;
                raw_end = hit.pos + hit.len;
                found = true;
            }
        }

        if (!found && anchor.forward) {
            std::string_view window(text.data() + start, end - start);
            if (param.is_text()) {
                if (auto m = match_text_value(param, std::string_view(lower.data() + start, end - start))) {
                    std::string value = collapse_spaces(text.substr(start + m->first, m->second));
                    if (param.name == "engine_model") value = clean_engine_model(value);
                    if (!value.empty() && !is_placeholder(value)) {
                        c.value = value;
                        raw_end = start + m->first + m->second;
                        found = true;
                    }
                }
            } else if (auto q = parse_quantity(window, units_, MAX_PRELUDE)) {
                if (make_numeric(param, *q, {}, c)) {
                    raw_end = start + q->end;
                    found = true;
                }
            }
        }

        if (!found) continue;

        c.raw_match = text.substr(raw_begin, raw_end - raw_begin);
        c.span.offset = raw_begin;
        c.span.length = raw_end - raw_begin;
        c.id = make_candidate_id(c.source_url, c.method, c.parameter, c.span, c.raw_match);
        out.push_back(std::move(c));
    }

    return out;
}

const ParameterSpec* SpecExtractor::match_label(const std::string& cell) const {
    NormalizedLabel label = normalize_label(cell);
    if (label.key.empty() || label.key.size() > 60) return nullptr;

    auto lookup = [&](const std::string& key) -> const ParameterSpec* {
        auto it = labels_.find(key);
        return it == labels_.end() ? nullptr : it->second;
    };

    if (auto p = lookup(label.key)) return p;

    std::string stripped = strip_qualifiers(label.key);
    if (auto p = lookup(stripped)) return p;

    // "operating weight kg"
    size_t space = stripped.rfind(' ');
    if (space != std::string::npos && units_.recognizes(stripped.substr(space + 1))) {
        if (auto p = lookup(stripped.substr(0, space))) return p;
    }
    return nullptr;
}

std::vector<ExtractionCandidate> SpecExtractor::extract_tables(const RawDocument& document, const std::string& brand,
                                                               const std::string& model) const {
    std::vector<ExtractionCandidate> out;

    for (size_t t = 0; t < document.tables.size(); ++t) {
        const Table& table = document.tables[t];
        if (rimpull_.detect(table)) continue;

        auto unit_col = find_unit_column(table);

        for (size_t r = 0; r < table.size(); ++r) {
            const auto& row = table[r];
            for (size_t col = 0; col < row.size(); ++col) {
                if (unit_col && col == *unit_col) continue;
                const std::string& label_cell = row[col];
                if (label_cell.empty() || label_cell.size() > 80) continue;

                const ParameterSpec* param = match_label(label_cell);
                if (!param) continue;

                // Value: next non-empty cell to the right unless it is another
                // label (header row of a vertical table), else the cell below
                std::optional<std::pair<size_t, size_t>> at;
                for (size_t cc = col + 1; cc < row.size(); ++cc) {
                    if (unit_col && cc == *unit_col) continue;
                    if (!trim_copy(row[cc]).empty()) {
                        if (!match_label(row[cc])) at = std::make_pair(r, cc);
                        break;
                    }
                }
                if (!at && r + 1 < table.size() && col < table[r + 1].size() &&
                    !trim_copy(table[r + 1][col]).empty() && !match_label(table[r + 1][col])) {
                    at = std::make_pair(r + 1, col);
                }
                if (!at) continue;

                const std::string value_cell = normalize_text(table[at->first][at->second], 256);
                if (is_placeholder(value_cell)) continue;

                ExtractionCandidate c = base_candidate(document, brand, model, *param, ExtractionMethod::TableCell);

                if (param->is_text()) {
                    std::string value;
                    if (param->name == "engine_model") {
                        value = clean_engine_model(collapse_spaces(value_cell));
                    } else {
                        std::string lower = to_lower_ascii(value_cell);
                        if (auto m = match_text_value(*param, lower)) {
                            value = collapse_spaces(value_cell.substr(m->first, m->second));
                        }
                    }
                    if (value.empty()) continue;
                    c.value = value;
                } else {
                    auto q = parse_quantity(value_cell, units_, 16);
                    if (!q) continue;

                    std::string hint;
                    if (unit_col && *unit_col < table[at->first].size()) {
                        std::string token = UnitTable::normalize_token(table[at->first][*unit_col]);
                        if (units_.recognizes(token)) hint = token;
                    }
                    if (hint.empty()) {
                        NormalizedLabel label = normalize_label(label_cell);
                        hint = label.unit_hint;
                        if (hint.empty()) {
                            size_t space = label.key.rfind(' ');
                            std::string last = space == std::string::npos ? std::string{} : label.key.substr(space + 1);
                            if (units_.recognizes(last)) hint = last;
                        }
                    }
                    if (!make_numeric(*param, *q, hint, c)) continue;
                }

                c.raw_match = label_cell + " | " + table[at->first][at->second];
                c.span.table = static_cast<int>(t);
                c.span.row = static_cast<int>(at->first);
                c.span.column = static_cast<int>(at->second);
                c.id = make_candidate_id(c.source_url, c.method, c.parameter, c.span, c.raw_match);
                out.push_back(std::move(c));
            }
        }
    }

    return out;
}

} // namespace MineSpec
