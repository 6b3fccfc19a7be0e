#pragma once

#include <vector>

#include "facade_types.h"
#include "side_summary_builder.h"

// 方位局部范围: taken from the panels assigned to the side only
struct SideExtent {
    double minX;
    double width;
    int panelCount;

    SideExtent() : minX(0), width(0), panelCount(0) {}
};

// 方位归一化: absolute world X -> side-local [0, 1] coordinate
class SideNormalizer {
public:
    SideNormalizer();

    void computeExtents(const std::vector<ClassifiedElement>& classified);

    const SideExtent& getExtent(FacadeSide side) const;

    // Center of [xmin, xmax] relative to the side extent. Not clamped;
    // 0 for a side whose width is zero (or that has no panels).
    double normalize(FacadeSide side, double xmin, double xmax) const;

    // Tags 1..N per side, ordered by position, then panel/door/window, then id
    std::vector<NormalizedElement> normalizeAll(const std::vector<ClassifiedElement>& classified) const;

    // Elements of one side, in tag order
    static std::vector<NormalizedElement> elementsOnSide(const std::vector<NormalizedElement>& elements,
                                                         FacadeSide side);

private:
    SideExtent m_extents[FACADE_SIDE_COUNT];
};
