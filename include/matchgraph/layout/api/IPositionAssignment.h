#pragma once

#include "../config/LayoutTypes.h"
#include "../config/LayoutOptions.h"

namespace matchgraph {

/// Abstract interface for coordinate assignment
class IPositionAssignment {
public:
    virtual ~IPositionAssignment() = default;

    /// Compute final coordinates for ordered layers
    /// @param layers Ordered layers from crossing minimization
    /// @param spacing Spacing constants
    virtual PositionMap place(const Layers& layers,
                              const SpacingOptions& spacing) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace matchgraph
