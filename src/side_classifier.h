#pragma once

#include "facade_types.h"
#include "facade_params.h"

// 立面方位分类: nearest footprint edge, ties resolved A, C, B, D
class SideClassifier {
public:
    SideClassifier(SideMode mode = SIDE_NEAREST, double edgeToleranceMm = 200.0);

    // SIDE_UNCLASSIFIED is only returned in edge-tolerance mode
    FacadeSide classify(double x, double y, const FacadeBounds& bounds) const;

    // Distance from (x, y) to the edge that defines the given side
    static double edgeDistance(double x, double y, const FacadeBounds& bounds, FacadeSide side);

    SideMode getMode() const { return m_mode; }
    double getEdgeTolerance() const { return m_edgeToleranceMm; }

private:
    SideMode m_mode;
    double m_edgeToleranceMm;
};
