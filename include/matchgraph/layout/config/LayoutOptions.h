#pragma once

#include <string>

namespace matchgraph {

/// Spacing constants for coordinate assignment.
///
/// x = margin + degree * horizontalSpacing; y is distributed around
/// canvasHeight / 2.
struct SpacingOptions {
    double margin = 50.0;
    double horizontalSpacing = 220.0;
    double verticalSpacing = 50.0;
    double minVerticalGap = 60.0;       ///< Two node radii
    double canvasHeight = 600.0;

    int densityThreshold = 4;           ///< Layers above this size get wider spacing
    double densityStep = 10.0;          ///< Extra spacing per node above the threshold

    double collisionWindowX = 80.0;     ///< Horizontal range checked for collisions
    double minSeparationY = 40.0;
    int collisionPasses = 2;

    double centerY() const { return canvasHeight / 2.0; }
};

/// Crossing minimization limits
struct CrossingOptions {
    bool enabled = true;
    int maxIterations = 7;              ///< Hard cap; also bounded by 2 * layerCount + 1
    int stallIterations = 2;            ///< Stop after this many iterations without improvement
};

/// Options for the comparison layout pipeline
struct LayoutOptions {
    SpacingOptions spacing;
    CrossingOptions crossing;

    /// @throws std::invalid_argument when a constant is out of range
    void validate() const;

    /// Serialize to a JSON object string
    std::string toJson() const;

    /// Parse options; fields not present keep their defaults
    /// @throws std::runtime_error on malformed JSON
    /// @throws std::invalid_argument if the parsed options fail validate()
    static LayoutOptions fromJson(const std::string& json);
};

}  // namespace matchgraph
