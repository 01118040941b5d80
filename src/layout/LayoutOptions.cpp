#include "matchgraph/layout/config/LayoutOptions.h"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace matchgraph {

namespace {
    void requirePositive(double value, const char* name) {
        if (!(value > 0.0)) {
            throw std::invalid_argument(std::string("LayoutOptions: ") + name + " must be positive");
        }
    }

    void requireNonNegative(double value, const char* name) {
        if (!(value >= 0.0)) {
            throw std::invalid_argument(std::string("LayoutOptions: ") + name + " must not be negative");
        }
    }

    template <typename T>
    void readIfPresent(const json& j, const char* key, T& target) {
        if (j.contains(key) && j[key].is_number()) {
            target = j[key].get<T>();
        }
    }
}

void LayoutOptions::validate() const {
    requireNonNegative(spacing.margin, "margin");
    requirePositive(spacing.horizontalSpacing, "horizontalSpacing");
    requirePositive(spacing.verticalSpacing, "verticalSpacing");
    requireNonNegative(spacing.minVerticalGap, "minVerticalGap");
    requireNonNegative(spacing.canvasHeight, "canvasHeight");
    requireNonNegative(spacing.densityThreshold, "densityThreshold");
    requireNonNegative(spacing.densityStep, "densityStep");
    requireNonNegative(spacing.collisionWindowX, "collisionWindowX");
    requireNonNegative(spacing.minSeparationY, "minSeparationY");
    requireNonNegative(spacing.collisionPasses, "collisionPasses");
    requireNonNegative(crossing.maxIterations, "maxIterations");
    requirePositive(crossing.stallIterations, "stallIterations");
}

std::string LayoutOptions::toJson() const {
    json j;
    j["spacing"] = {
        {"margin", spacing.margin},
        {"horizontalSpacing", spacing.horizontalSpacing},
        {"verticalSpacing", spacing.verticalSpacing},
        {"minVerticalGap", spacing.minVerticalGap},
        {"canvasHeight", spacing.canvasHeight},
        {"densityThreshold", spacing.densityThreshold},
        {"densityStep", spacing.densityStep},
        {"collisionWindowX", spacing.collisionWindowX},
        {"minSeparationY", spacing.minSeparationY},
        {"collisionPasses", spacing.collisionPasses}
    };
    j["crossing"] = {
        {"enabled", crossing.enabled},
        {"maxIterations", crossing.maxIterations},
        {"stallIterations", crossing.stallIterations}
    };
    return j.dump(2);
}

LayoutOptions LayoutOptions::fromJson(const std::string& jsonStr) {
    LayoutOptions options;

    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("LayoutOptions: invalid JSON: ") + e.what());
    }

    if (j.contains("spacing") && j["spacing"].is_object()) {
        const json& s = j["spacing"];
        readIfPresent(s, "margin", options.spacing.margin);
        readIfPresent(s, "horizontalSpacing", options.spacing.horizontalSpacing);
        readIfPresent(s, "verticalSpacing", options.spacing.verticalSpacing);
        readIfPresent(s, "minVerticalGap", options.spacing.minVerticalGap);
        readIfPresent(s, "canvasHeight", options.spacing.canvasHeight);
        readIfPresent(s, "densityThreshold", options.spacing.densityThreshold);
        readIfPresent(s, "densityStep", options.spacing.densityStep);
        readIfPresent(s, "collisionWindowX", options.spacing.collisionWindowX);
        readIfPresent(s, "minSeparationY", options.spacing.minSeparationY);
        readIfPresent(s, "collisionPasses", options.spacing.collisionPasses);
    }

    if (j.contains("crossing") && j["crossing"].is_object()) {
        const json& c = j["crossing"];
        if (c.contains("enabled") && c["enabled"].is_boolean()) {
            options.crossing.enabled = c["enabled"].get<bool>();
        }
        readIfPresent(c, "maxIterations", options.crossing.maxIterations);
        readIfPresent(c, "stallIterations", options.crossing.stallIterations);
    }

    options.validate();
    return options;
}

}  // namespace matchgraph
