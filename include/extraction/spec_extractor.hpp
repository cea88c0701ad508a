/**
 * @file spec_extractor.hpp
 * @brief Raw document to extraction candidates
 */

#pragma once

#include <config/settings.hpp>
#include <core/parameters.hpp>
#include <core/types.hpp>
#include <extraction/rimpull_extractor.hpp>
#include <extraction/value_parser.hpp>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace MineSpec {

/**
 * @brief Extraction Engine
 *
 * Pure function of the document: no I/O, no shared mutable state, so one
 * instance can serve every worker thread. Malformed input produces fewer
 * candidates, never an exception.
 *
 * Prose: every parameter alias is an anchor. Anchors are claimed longest
 * first so "empty weight" is not also read as "weight". The value is parsed
 * from a bounded window after the anchor, cut short at the next anchor.
 *
 * Tables: a label cell matching an alias (exactly, or after dropping
 * qualifier words) takes its value from the next non-empty cell to the
 * right, else the cell below.
 */
class SpecExtractor {
public:
    static constexpr size_t WINDOW_AFTER = 160;
    static constexpr size_t MAX_PRELUDE = 40;
    static constexpr size_t TRAILING_LOOKBACK = 24;

    explicit SpecExtractor(const Settings& settings);

    ExtractionResult extract(const RawDocument& document, const std::string& brand,
                             const std::string& model) const;

    std::vector<ExtractionCandidate> extract_text(const RawDocument& document, const std::string& brand,
                                                  const std::string& model) const;

    std::vector<ExtractionCandidate> extract_tables(const RawDocument& document, const std::string& brand,
                                                    const std::string& model) const;

    /**
     * @brief Parameter a table label refers to, nullptr when none
     */
    const ParameterSpec* match_label(const std::string& cell) const;

private:
    struct Anchor {
        std::string phrase;
        const ParameterSpec* param = nullptr;
        bool forward = true;   // value follows the phrase
        bool trailing = false; // value precedes the phrase
    };

    struct Hit {
        size_t pos = 0;
        size_t len = 0;
        const Anchor* anchor = nullptr;
    };

    std::vector<Hit> find_anchors(const std::string& lower) const;

    bool make_numeric(const ParameterSpec& param, const Quantity& q, const std::string& hint,
                      ExtractionCandidate& out) const;

    /**
     * @return (offset, length) of the value inside lower
     */
    std::optional<std::pair<size_t, size_t>> match_text_value(const ParameterSpec& param,
                                                              std::string_view lower) const;

    ExtractionCandidate base_candidate(const RawDocument& document, const std::string& brand,
                                       const std::string& model, const ParameterSpec& param,
                                       ExtractionMethod method) const;

    ExtractionSettings settings_;
    UnitTable units_;
    std::vector<Anchor> anchors_; // longest phrase first
    std::map<std::string, const ParameterSpec*> labels_;
    std::map<std::string, std::regex> text_patterns_;
    RimpullExtractor rimpull_;
};

} // namespace MineSpec
