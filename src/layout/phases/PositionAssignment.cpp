#include "PositionAssignment.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>
#include <cmath>

namespace matchgraph {

double LayeredPositionAssignment::layerSpacing(size_t count, const SpacingOptions& spacing) {
    double base = spacing.verticalSpacing;
    if (static_cast<int>(count) > spacing.densityThreshold) {
        base += (static_cast<int>(count) - spacing.densityThreshold) * spacing.densityStep;
    }
    return std::max(base, spacing.minVerticalGap);
}

PositionMap LayeredPositionAssignment::place(
    const Layers& layers,
    const SpacingOptions& spacing) const {

    std::vector<Entry> entries;
    const double centerY = spacing.centerY();

    for (const auto& layer : layers) {
        const double x = spacing.margin + layer.degree * spacing.horizontalSpacing;
        const size_t count = layer.nodes.size();
        const double step = layerSpacing(count, spacing);
        const double half = (static_cast<double>(count) - 1.0) / 2.0;

        for (size_t i = 0; i < count; ++i) {
            double y = centerY + (static_cast<double>(i) - half) * step;
            entries.push_back({layer.nodes[i], {x, y}});
        }
    }

    for (int pass = 0; pass < spacing.collisionPasses; ++pass) {
        int moved = resolveCollisions(entries, spacing);
        LOG_TRACE("collision pass {} moved {} nodes", pass + 1, moved);
        if (moved == 0) break;
    }

    PositionMap positions;
    for (auto& entry : entries) {
        positions.emplace(std::move(entry.id), entry.position);
    }
    return positions;
}

int LayeredPositionAssignment::resolveCollisions(
    std::vector<Entry>& entries,
    const SpacingOptions& spacing) const {

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.position.x != b.position.x) return a.position.x < b.position.x;
        if (a.position.y != b.position.y) return a.position.y < b.position.y;
        return a.id < b.id;
    });

    int moved = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        for (size_t j = i + 1; j < entries.size(); ++j) {
            Entry& upper = entries[i];
            Entry& lower = entries[j];
            if (lower.position.x - upper.position.x > spacing.collisionWindowX) break;

            double dy = lower.position.y - upper.position.y;
            if (std::abs(dy) >= spacing.minSeparationY) continue;

            // Push whichever node sits lower on the canvas
            Entry& pushed = dy >= 0.0 ? lower : upper;
            const Entry& anchor = dy >= 0.0 ? upper : lower;
            pushed.position.y = anchor.position.y + spacing.minSeparationY;
            ++moved;
        }
    }
    return moved;
}

}  // namespace matchgraph
