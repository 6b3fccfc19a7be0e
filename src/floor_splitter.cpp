#include "floor_splitter.h"

#include <algorithm>

FloorSplitter::FloorSplitter(FloorStatistic statistic)
    : m_statistic(statistic)
{
}

double FloorSplitter::computeSplit(const std::vector<BimElement>& panels) const {
    std::vector<double> values;
    values.reserve(panels.size());

    for (const auto& panel : panels) {
        if (!panel.hasBox) continue;
        values.push_back(statistic(panel));
    }

    if (values.empty()) {
        throw InsufficientDataError("No panel Z values found for floor split");
    }

    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

FloorLevel FloorSplitter::classify(double statistic, double split) const {
    return statistic < split ? FLOOR_1 : FLOOR_2;
}

double FloorSplitter::statistic(const BimElement& element) const {
    if (m_statistic == FLOOR_STAT_CENTER) {
        return element.centerZ();
    }
    return element.minBound.z();
}

double FloorSplitter::statistic(const DoorOpening& opening) const {
    std::vector<const BimElement*> members = opening.members();

    if (m_statistic == FLOOR_STAT_CENTER) {
        double sum = 0.0;
        for (const BimElement* member : members) {
            sum += member->centerZ();
        }
        return sum / static_cast<double>(members.size());
    }

    double bottom = members.front()->minBound.z();
    for (const BimElement* member : members) {
        bottom = std::min(bottom, member->minBound.z());
    }
    return bottom;
}
