#include "bounds_computer.h"

BoundsComputer::BoundsComputer(BoundsStrategy strategy)
    : m_strategy(strategy)
{
}

FacadeBounds BoundsComputer::compute(const std::vector<BimElement>& panels) const {
    Eigen::AlignedBox2d footprint;

    for (const auto& panel : panels) {
        if (!panel.hasBox) continue;
        extendFootprint(panel, footprint);
    }

    if (footprint.isEmpty()) {
        throw NoGeometryError("No panel bounding boxes found, cannot determine building bounds");
    }

    return FacadeBounds(footprint.min().x(), footprint.max().x(),
                        footprint.min().y(), footprint.max().y());
}

void BoundsComputer::extendFootprint(const BimElement& panel, Eigen::AlignedBox2d& footprint) const {
    if (m_strategy == BOUNDS_MIDPOINTS) {
        footprint.extend(Eigen::Vector2d(panel.centerX(), panel.centerY()));
        return;
    }

    footprint.extend(panel.minBound.head<2>());
    footprint.extend(panel.maxBound.head<2>());
}
