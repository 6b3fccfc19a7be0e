#include <iostream>
#include <vector>

#include "floor_splitter.h"

static int g_failures = 0;

static void check(bool condition, const std::string& name) {
    std::cout << "  " << (condition ? "PASS" : "FAIL") << ": " << name << std::endl;
    if (!condition) g_failures++;
}

static void testBottomSplit() {
    std::cout << "\nBottom statistic" << std::endl;

    std::vector<BimElement> panels;
    panels.push_back(BimElement(1, 0, 100, 0, 100, 3000, 6000));
    panels.push_back(BimElement(2, 0, 100, 0, 100, 0, 3000));
    panels.push_back(BimElement(3, 0, 100, 0, 100, 3000, 6000));
    panels.push_back(BimElement(4, 0, 100, 0, 100, 0, 3000));

    FloorSplitter splitter(FLOOR_STAT_BOTTOM);
    double split = splitter.computeSplit(panels);
    check(split == 3000, "even count takes the upper middle value");
    check(splitter.classify(splitter.statistic(panels[1]), split) == FLOOR_1, "zmin 0 -> floor1");
    check(splitter.classify(splitter.statistic(panels[0]), split) == FLOOR_2, "zmin equal to split -> floor2");

    panels.pop_back();
    panels.push_back(BimElement(5, 0, 100, 0, 100, 100, 3000));
    panels.push_back(BimElement());
    check(splitter.computeSplit(panels) == 3000, "panel without box ignored");

    std::vector<BimElement> odd;
    odd.push_back(BimElement(1, 0, 1, 0, 1, 3000, 6000));
    odd.push_back(BimElement(2, 0, 1, 0, 1, 0, 3000));
    odd.push_back(BimElement(3, 0, 1, 0, 1, 100, 3000));
    check(splitter.computeSplit(odd) == 100, "odd count takes the middle value");
}

static void testCenterSplit() {
    std::cout << "\nCenter statistic" << std::endl;

    std::vector<BimElement> panels;
    panels.push_back(BimElement(1, 0, 100, 0, 100, 0, 3000));
    panels.push_back(BimElement(2, 0, 100, 0, 100, 3000, 6000));
    panels.push_back(BimElement(3, 0, 100, 0, 100, 0, 2000));

    FloorSplitter splitter(FLOOR_STAT_CENTER);
    double split = splitter.computeSplit(panels);
    check(split == 1500, "median of centers 1000, 1500, 4500");
    check(split >= 1000 && split <= 4500, "split lies within the statistic range");
    check(splitter.classify(1000, split) == FLOOR_1, "center 1000 -> floor1");
    check(splitter.classify(4500, split) == FLOOR_2, "center 4500 -> floor2");
}

static void testMissingData() {
    std::cout << "\nMissing data" << std::endl;

    bool thrown = false;
    try {
        FloorSplitter().computeSplit(std::vector<BimElement>(2));
    } catch (const InsufficientDataError&) {
        thrown = true;
    }
    check(thrown, "no panel boxes raise InsufficientDataError");

    thrown = false;
    try {
        std::vector<BimElement> single;
        single.push_back(BimElement(1, 0, 1, 0, 1, 250, 900));
        check(FloorSplitter().computeSplit(single) == 250, "single panel is its own split");
    } catch (const InsufficientDataError&) {
        thrown = true;
    }
    check(!thrown, "one boxed panel is enough");
}

static void testOpeningStatistic() {
    std::cout << "\nDoor opening statistic" << std::endl;

    DoorOpening opening;
    opening.studLeft = BimElement(1, 0, 100, 0, 100, 10, 2010);
    opening.studRight = BimElement(2, 1000, 1100, 0, 100, 0, 2000);
    opening.header = BimElement(3, 0, 1100, 0, 100, 2000, 2200);

    check(FloorSplitter(FLOOR_STAT_BOTTOM).statistic(opening) == 0, "bottom is the lowest member zmin");
    check(FloorSplitter(FLOOR_STAT_CENTER).statistic(opening) == (1010.0 + 1000.0 + 2100.0) / 3.0,
          "center is the mean member center");

    opening.header.reset();
    check(FloorSplitter(FLOOR_STAT_CENTER).statistic(opening) == 1005.0, "center without header");
}

int main() {
    std::cout << "Testing Floor Split" << std::endl;
    std::cout << "===================" << std::endl;

    testBottomSplit();
    testCenterSplit();
    testMissingData();
    testOpeningStatistic();

    std::cout << "\n===================" << std::endl;
    if (g_failures > 0) {
        std::cout << g_failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "Test completed!" << std::endl;
    return 0;
}
