/**
 * @file types.cpp
 * @brief Enum names, value formatting and candidate identity
 */

#include <core/types.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace MineSpec {

std::string to_string(ContentType v) {
    return v == ContentType::Pdf ? "pdf" : "html";
}

std::string to_string(ExtractionMethod v) {
    switch (v) {
        case ExtractionMethod::Regex:        return "regex";
        case ExtractionMethod::TableCell:    return "table_cell";
        case ExtractionMethod::RimpullTable: return "rimpull_table";
    }
    return "regex";
}

std::string to_string(SourceTier v) {
    switch (v) {
        case SourceTier::OemPrimary:   return "oem_primary";
        case SourceTier::OemSecondary: return "oem_secondary";
        case SourceTier::Dealer:       return "dealer";
        case SourceTier::ThirdParty:   return "third_party";
        case SourceTier::Unknown:      return "unknown";
    }
    return "unknown";
}

std::string to_string(SpecStatus v) {
    switch (v) {
        case SpecStatus::Validated: return "validated";
        case SpecStatus::Flagged:   return "flagged";
        case SpecStatus::Rejected:  return "rejected";
    }
    return "flagged";
}

std::string to_string(EquipmentClass v) {
    switch (v) {
        case EquipmentClass::Unspecified: return "unspecified";
        case EquipmentClass::Loading:     return "loading";
        case EquipmentClass::Haulage:     return "haulage";
    }
    return "unspecified";
}

std::optional<ContentType> parse_content_type(std::string_view s) {
    if (s == "html") return ContentType::Html;
    if (s == "pdf") return ContentType::Pdf;
    return std::nullopt;
}

std::optional<ExtractionMethod> parse_extraction_method(std::string_view s) {
    if (s == "regex") return ExtractionMethod::Regex;
    if (s == "table_cell") return ExtractionMethod::TableCell;
    if (s == "rimpull_table") return ExtractionMethod::RimpullTable;
    return std::nullopt;
}

std::optional<SourceTier> parse_source_tier(std::string_view s) {
    if (s == "oem_primary") return SourceTier::OemPrimary;
    if (s == "oem_secondary") return SourceTier::OemSecondary;
    if (s == "dealer") return SourceTier::Dealer;
    if (s == "third_party") return SourceTier::ThirdParty;
    if (s == "unknown") return SourceTier::Unknown;
    return std::nullopt;
}

std::optional<SpecStatus> parse_spec_status(std::string_view s) {
    if (s == "validated") return SpecStatus::Validated;
    if (s == "flagged") return SpecStatus::Flagged;
    if (s == "rejected") return SpecStatus::Rejected;
    return std::nullopt;
}

std::optional<EquipmentClass> parse_equipment_class(std::string_view s) {
    if (s == "unspecified") return EquipmentClass::Unspecified;
    if (s == "loading") return EquipmentClass::Loading;
    if (s == "haulage") return EquipmentClass::Haulage;
    return std::nullopt;
}

std::string MatchedSpan::to_string() const {
    std::ostringstream oss;
    if (table >= 0) {
        oss << "table " << table << " r" << row << " c" << column;
    } else {
        oss << "chars " << offset << "+" << length;
    }
    return oss.str();
}

std::string format_value(const SpecValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;

    double d = std::get<double>(value);
    std::ostringstream oss;
    if (std::fabs(d - std::round(d)) < 1e-9 && std::fabs(d) < 1e15) {
        oss << static_cast<long long>(std::llround(d));
    } else {
        oss << std::setprecision(10) << d;
    }
    return oss.str();
}

std::string make_candidate_id(const std::string& url, ExtractionMethod method,
                              const std::string& parameter, const MatchedSpan& span,
                              const std::string& raw_match) {
    auto h = BLAKE3Pipeline::hash_fields({
        url,
        to_string(method),
        parameter,
        std::to_string(span.offset),
        std::to_string(span.length),
        std::to_string(span.table) + ":" + std::to_string(span.row) + ":" + std::to_string(span.column),
        raw_match
    });
    return BLAKE3Pipeline::to_hex(h);
}

bool ValidatedSpec::operator==(const ValidatedSpec& o) const {
    return brand == o.brand && model == o.model && parameter == o.parameter &&
           value == o.value && unit == o.unit && confidence == o.confidence &&
           supporting_candidates == o.supporting_candidates &&
           conflicting_candidates == o.conflicting_candidates &&
           status == o.status && reason == o.reason;
}

double RimpullCurve::max_force_kn() const {
    double best = 0.0;
    for (const auto& p : points) best = std::max(best, p.force_kn);
    return best;
}

} // namespace MineSpec
