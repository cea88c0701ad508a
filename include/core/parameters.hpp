/**
 * @file parameters.hpp
 * @brief Catalog of the equipment parameters the engine knows about
 */

#pragma once

#include <core/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace MineSpec {

enum class ParameterKind {
    Numeric, // measured quantity with a canonical unit
    Count,   // small integer, no unit
    Text     // model names, standards, categories
};

struct Bounds {
    double min = 0.0;
    double max = 0.0;

    bool contains(double v) const { return v >= min && v <= max; }
};

/**
 * @brief Static description of one parameter
 *
 * Aliases are lowercase phrases used both as prose anchors and as table
 * labels. Trailing aliases follow the value ("16 cylinders").
 */
struct ParameterSpec {
    std::string name;
    ParameterKind kind = ParameterKind::Numeric;
    std::string canonical_unit;
    std::vector<std::string> aliases;
    std::vector<std::string> trailing_aliases;
    std::string text_pattern; // Text kind: searched after the anchor, group 1 is the value
    Bounds bounds;            // plausible range in the canonical unit
    double tolerance_pct = 2.0;
    bool core_loading = false;
    bool core_haulage = false;

    bool is_text() const { return kind == ParameterKind::Text; }
};

class ParameterCatalog {
public:
    static const ParameterCatalog& builtin();

    const std::vector<ParameterSpec>& all() const { return params_; }

    /**
     * @return nullptr for unknown names
     */
    const ParameterSpec* find(std::string_view name) const;

    /**
     * @brief Core parameters used for the completeness score of one class
     */
    std::vector<std::string> core_parameters(EquipmentClass cls) const;

private:
    ParameterCatalog();

    std::vector<ParameterSpec> params_;
};

/**
 * @brief Guess whether a model is a loading tool or a haul truck
 *
 * Uses the model name first, then which parameters were extracted.
 */
MINESPEC_API EquipmentClass infer_equipment_class(const std::string& model,
                                                  const std::vector<ExtractionCandidate>& candidates);

} // namespace MineSpec
