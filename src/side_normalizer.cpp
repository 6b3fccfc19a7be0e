#include "side_normalizer.h"

#include <algorithm>
#include <Eigen/Geometry>

static bool tagOrder(const NormalizedElement& a, const NormalizedElement& b) {
    if (a.position != b.position) {
        return a.position < b.position;
    }
    if (a.kind != b.kind) {
        return a.kind < b.kind;
    }
    return a.id < b.id;
}

SideNormalizer::SideNormalizer() {
}

void SideNormalizer::computeExtents(const std::vector<ClassifiedElement>& classified) {
    typedef Eigen::AlignedBox1d::VectorType Coord;

    for (FacadeSide side : FACADE_SIDES) {
        Eigen::AlignedBox1d span;
        int panelCount = 0;

        for (const auto& element : classified) {
            if (element.kind != KIND_PANEL || element.side != side) continue;
            span.extend(Coord::Constant(element.xmin));
            span.extend(Coord::Constant(element.xmax));
            panelCount++;
        }

        SideExtent extent;
        if (!span.isEmpty()) {
            extent.minX = span.min()(0);
            extent.width = span.max()(0) - span.min()(0);
            extent.panelCount = panelCount;
        }
        m_extents[static_cast<int>(side)] = extent;
    }
}

const SideExtent& SideNormalizer::getExtent(FacadeSide side) const {
    return m_extents[static_cast<int>(side)];
}

double SideNormalizer::normalize(FacadeSide side, double xmin, double xmax) const {
    const SideExtent& extent = getExtent(side);
    if (extent.width <= 0.0) {
        return 0.0;
    }
    double center = (xmin + xmax) / 2.0;
    return (center - extent.minX) / extent.width;
}

std::vector<NormalizedElement> SideNormalizer::normalizeAll(const std::vector<ClassifiedElement>& classified) const {
    std::vector<NormalizedElement> result;

    for (FacadeSide side : FACADE_SIDES) {
        std::vector<NormalizedElement> onSide;

        for (const auto& element : classified) {
            if (element.side != side) continue;

            NormalizedElement normalized;
            normalized.kind = element.kind;
            normalized.id = element.id;
            normalized.side = side;
            normalized.floor = element.floor;
            normalized.xmin = element.xmin;
            normalized.xmax = element.xmax;
            normalized.position = normalize(side, element.xmin, element.xmax);
            onSide.push_back(normalized);
        }

        std::stable_sort(onSide.begin(), onSide.end(), tagOrder);
        for (size_t i = 0; i < onSide.size(); ++i) {
            onSide[i].tag = static_cast<int>(i) + 1;
        }

        result.insert(result.end(), onSide.begin(), onSide.end());
    }

    return result;
}

std::vector<NormalizedElement> SideNormalizer::elementsOnSide(const std::vector<NormalizedElement>& elements,
                                                              FacadeSide side) {
    std::vector<NormalizedElement> result;
    for (const auto& element : elements) {
        if (element.side == side) {
            result.push_back(element);
        }
    }
    return result;
}
