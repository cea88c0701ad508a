/**
 * @file types.hpp
 * @brief Documents, candidates and reconciled records
 */

#pragma once

#include <export.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace MineSpec {

enum class ContentType { Html, Pdf };

enum class ExtractionMethod { Regex, TableCell, RimpullTable };

/**
 * @brief Coarse trust class of the site a document came from
 */
enum class SourceTier { OemPrimary, OemSecondary, Dealer, ThirdParty, Unknown };

enum class SpecStatus { Validated, Flagged, Rejected };

enum class EquipmentClass { Unspecified, Loading, Haulage };

std::string to_string(ContentType v);
std::string to_string(ExtractionMethod v);
std::string to_string(SourceTier v);
std::string to_string(SpecStatus v);
std::string to_string(EquipmentClass v);

std::optional<ContentType> parse_content_type(std::string_view s);
std::optional<ExtractionMethod> parse_extraction_method(std::string_view s);
std::optional<SourceTier> parse_source_tier(std::string_view s);
std::optional<SpecStatus> parse_spec_status(std::string_view s);
std::optional<EquipmentClass> parse_equipment_class(std::string_view s);

/// Rows x columns of cell text. Header rows are not assumed.
using Table = std::vector<std::vector<std::string>>;

/**
 * @brief Fetched page or brochure, as handed over by the fetch layer
 */
struct RawDocument {
    std::string url;
    ContentType content_type = ContentType::Html;
    std::string text;
    std::vector<Table> tables;
    std::chrono::system_clock::time_point fetched_at{};
    std::string source_domain;
};

/**
 * @brief Where in the document a candidate was found
 *
 * Prose matches fill offset/length; table matches fill table/row/column.
 */
struct MatchedSpan {
    size_t offset = 0;
    size_t length = 0;
    int table = -1;
    int row = -1;
    int column = -1;

    std::string to_string() const;

    bool operator==(const MatchedSpan& o) const {
        return offset == o.offset && length == o.length &&
               table == o.table && row == o.row && column == o.column;
    }
};

/// Numeric parameters carry a double, text parameters a string.
using SpecValue = std::variant<double, std::string>;

std::string format_value(const SpecValue& value);

struct ExtractionCandidate {
    std::string id; // hex BLAKE3 digest, see make_candidate_id()
    std::string brand;
    std::string model;
    std::string parameter;
    std::string raw_match;
    SpecValue value;
    std::optional<std::string> unit;
    ExtractionMethod method = ExtractionMethod::Regex;
    std::string source_url;
    MatchedSpan span;

    bool is_numeric() const { return std::holds_alternative<double>(value); }
    double number() const { return std::get<double>(value); }
    const std::string& text() const { return std::get<std::string>(value); }
};

/**
 * @brief Derive the immutable identity of an extraction
 */
MINESPEC_API std::string make_candidate_id(const std::string& url, ExtractionMethod method,
                                           const std::string& parameter, const MatchedSpan& span,
                                           const std::string& raw_match);

struct ScoredCandidate {
    ExtractionCandidate candidate;
    double confidence = 0.0;
    SourceTier tier = SourceTier::Unknown;
};

struct SpecKey {
    std::string brand;
    std::string model;
    std::string parameter;

    bool operator<(const SpecKey& o) const {
        if (brand != o.brand) return brand < o.brand;
        if (model != o.model) return model < o.model;
        return parameter < o.parameter;
    }
    bool operator==(const SpecKey& o) const {
        return brand == o.brand && model == o.model && parameter == o.parameter;
    }
};

/**
 * @brief One reconciled value per (brand, model, parameter)
 *
 * Candidate id lists are kept sorted so that equal inputs produce equal records.
 */
struct ValidatedSpec {
    std::string brand;
    std::string model;
    std::string parameter;
    SpecValue value;
    std::optional<std::string> unit;
    double confidence = 0.0;
    std::vector<std::string> supporting_candidates;
    std::vector<std::string> conflicting_candidates;
    SpecStatus status = SpecStatus::Flagged;
    std::string reason; // why flagged or rejected, empty when validated

    SpecKey key() const { return {brand, model, parameter}; }

    bool operator==(const ValidatedSpec& o) const;
    bool operator!=(const ValidatedSpec& o) const { return !(*this == o); }
};

struct RimpullPoint {
    int gear = 0; // negative for reverse
    double speed_kph = 0.0;
    double force_kn = 0.0;

    bool operator==(const RimpullPoint& o) const {
        return gear == o.gear && speed_kph == o.speed_kph && force_kn == o.force_kn;
    }
};

/**
 * @brief Tractive force against speed, per gear
 *
 * Points are ordered by gear then speed. Rows where force rises with speed
 * inside one gear are kept and described in violations.
 */
struct RimpullCurve {
    std::string brand;
    std::string model;
    std::vector<RimpullPoint> points;
    std::vector<std::string> violations;
    std::string source_url;
    SourceTier tier = SourceTier::Unknown;

    bool monotonic() const { return violations.empty(); }
    double max_force_kn() const;
};

struct ExtractionResult {
    std::vector<ExtractionCandidate> candidates;
    std::vector<RimpullCurve> curves;
};

} // namespace MineSpec
