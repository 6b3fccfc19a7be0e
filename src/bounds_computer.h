#pragma once

#include <vector>
#include <Eigen/Geometry>

#include "facade_types.h"
#include "facade_params.h"

// 建筑外轮廓计算: footprint from panel bounding boxes
class BoundsComputer {
public:
    explicit BoundsComputer(BoundsStrategy strategy = BOUNDS_EXTENTS);

    // Throws NoGeometryError when no panel yields a bounding box
    FacadeBounds compute(const std::vector<BimElement>& panels) const;

    BoundsStrategy getStrategy() const { return m_strategy; }

private:
    // Grows the plan-view footprint by one panel
    void extendFootprint(const BimElement& panel, Eigen::AlignedBox2d& footprint) const;

    BoundsStrategy m_strategy;
};
