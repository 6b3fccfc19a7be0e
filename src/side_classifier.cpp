#include "side_classifier.h"

#include <cmath>
#include <limits>

// Fixed tie-break priority
static const FacadeSide TIE_BREAK_ORDER[FACADE_SIDE_COUNT] = { SIDE_A, SIDE_C, SIDE_B, SIDE_D };

SideClassifier::SideClassifier(SideMode mode, double edgeToleranceMm)
    : m_mode(mode)
    , m_edgeToleranceMm(edgeToleranceMm)
{
}

FacadeSide SideClassifier::classify(double x, double y, const FacadeBounds& bounds) const {
    FacadeSide best = TIE_BREAK_ORDER[0];
    double bestDistance = edgeDistance(x, y, bounds, best);

    // strict '<' keeps the earlier side on equal distances
    for (int i = 1; i < FACADE_SIDE_COUNT; ++i) {
        double distance = edgeDistance(x, y, bounds, TIE_BREAK_ORDER[i]);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = TIE_BREAK_ORDER[i];
        }
    }

    if (m_mode == SIDE_EDGE_TOLERANCE && bestDistance > m_edgeToleranceMm) {
        return SIDE_UNCLASSIFIED;
    }
    return best;
}

double SideClassifier::edgeDistance(double x, double y, const FacadeBounds& bounds, FacadeSide side) {
    switch (side) {
        case SIDE_A: return std::abs(x - bounds.xmin);
        case SIDE_C: return std::abs(x - bounds.xmax);
        case SIDE_B: return std::abs(y - bounds.ymin);
        case SIDE_D: return std::abs(y - bounds.ymax);
        default: break;
    }
    return std::numeric_limits<double>::max();
}
