#pragma once

#include <vector>

#include "facade_types.h"
#include "facade_params.h"

// 楼层分界: single Z threshold between floor 1 and floor 2
class FloorSplitter {
public:
    explicit FloorSplitter(FloorStatistic statistic = FLOOR_STAT_BOTTOM);

    // Median (element count/2 of the ascending list) of the panel statistics.
    // Throws InsufficientDataError when no panel has a bounding box.
    double computeSplit(const std::vector<BimElement>& panels) const;

    // floor 1 when strictly below the split
    FloorLevel classify(double statistic, double split) const;

    double statistic(const BimElement& element) const;

    // bottom: lowest member zmin; center: mean of the member vertical centers
    double statistic(const DoorOpening& opening) const;

    FloorStatistic getStatistic() const { return m_statistic; }

private:
    FloorStatistic m_statistic;
};
