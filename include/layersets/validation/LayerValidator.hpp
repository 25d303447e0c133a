#pragma once

#include <layersets/log/TaggedLogger.hpp>
#include <layersets/model/LayerDocument.hpp>
#include <layersets/validation/ValidationResult.hpp>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <string>
#include <vector>

namespace LS {

// What happens to a numeric field outside its allowed range.
enum class NumericPolicy {
    Clamp,  // clamp into range and warn
    Drop,   // remove the field and warn
    Reject  // fail the layer
};

struct NumericRule {
    double        min    = 0.0;
    double        max    = 0.0;
    NumericPolicy policy = NumericPolicy::Drop;
};

using NumericRuleTable = phmap::flat_hash_map<std::string, NumericRule>;

[[nodiscard]] auto defaultNumericRules() -> NumericRuleTable;
[[nodiscard]] auto defaultAllowedFonts() -> std::vector<std::string>;

struct ValidatorConfig {
    std::size_t              maxLayerCount   = 100;
    std::size_t              maxPoints       = 1000;
    std::size_t              maxRichTextRuns = 100;
    std::size_t              maxTextLength   = 1000;
    std::size_t              maxNameLength   = 255;
    std::size_t              maxChildren     = 1000;
    std::size_t              maxShapePaths   = 100;
    std::size_t              maxImageBytes   = 1024 * 1024;
    // Bound for coordinates and every numeric field without its own rule.
    double                   coordinateBound = 100000.0;
    std::vector<std::string> allowedFonts    = defaultAllowedFonts();
    std::string              defaultFont     = "Arial";
    NumericRuleTable         numericRules    = defaultNumericRules();
};

/*
 * Turns an untrusted layer list into canonical LayerDocuments. Each layer is
 * checked against the schema of its type; every string passes through the
 * sanitizer for its field kind; unknown keys are dropped. A layer that fails makes
 * the whole batch invalid, warnings never do.
 */
class LayerValidator {
public:
    LayerValidator(ValidatorConfig config, TaggedLogger& logger);

    [[nodiscard]] auto validateLayers(nlohmann::json const& rawLayers) const
        -> ValidationResult<std::vector<LayerDocument>>;

    // Single layer; messages carry no "Layer <i>:" prefix.
    [[nodiscard]] auto validateLayer(nlohmann::json const& rawLayer, std::size_t index = 0) const
        -> ValidationResult<LayerDocument>;

    [[nodiscard]] auto config() const -> ValidatorConfig const& { return config_; }

private:
    ValidatorConfig config_;
    TaggedLogger&   logger_;
};

} // namespace LS
