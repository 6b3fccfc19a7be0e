#include "facade_params.h"

std::string boundsStrategyToString(BoundsStrategy strategy) {
    return strategy == BOUNDS_MIDPOINTS ? "midpoints" : "extents";
}

std::string floorStatisticToString(FloorStatistic statistic) {
    return statistic == FLOOR_STAT_CENTER ? "center" : "bottom";
}

std::string sideModeToString(SideMode mode) {
    return mode == SIDE_EDGE_TOLERANCE ? "edge_tolerance" : "nearest";
}

std::string doorGroupingToString(DoorGrouping grouping) {
    return grouping == DOOR_GROUP_NONE ? "none" : "components";
}

std::string studPairingToString(StudPairing pairing) {
    return pairing == STUD_PAIR_TWO_ROWS ? "two_rows" : "sequential";
}

std::string panelGroupingToString(PanelGrouping grouping) {
    return grouping == PANEL_GROUP_COMPONENTS ? "components" : "none";
}

bool parseBoundsStrategy(const std::string& text, BoundsStrategy& strategy) {
    if (text == "extents") { strategy = BOUNDS_EXTENTS; return true; }
    if (text == "midpoints") { strategy = BOUNDS_MIDPOINTS; return true; }
    return false;
}

bool parseFloorStatistic(const std::string& text, FloorStatistic& statistic) {
    if (text == "bottom") { statistic = FLOOR_STAT_BOTTOM; return true; }
    if (text == "center") { statistic = FLOOR_STAT_CENTER; return true; }
    return false;
}

bool parseSideMode(const std::string& text, SideMode& mode) {
    if (text == "nearest") { mode = SIDE_NEAREST; return true; }
    if (text == "edge_tolerance") { mode = SIDE_EDGE_TOLERANCE; return true; }
    return false;
}

bool parseDoorGrouping(const std::string& text, DoorGrouping& grouping) {
    if (text == "components") { grouping = DOOR_GROUP_COMPONENTS; return true; }
    if (text == "none") { grouping = DOOR_GROUP_NONE; return true; }
    return false;
}

bool parseStudPairing(const std::string& text, StudPairing& pairing) {
    if (text == "sequential") { pairing = STUD_PAIR_SEQUENTIAL; return true; }
    if (text == "two_rows") { pairing = STUD_PAIR_TWO_ROWS; return true; }
    return false;
}

bool parsePanelGrouping(const std::string& text, PanelGrouping& grouping) {
    if (text == "none") { grouping = PANEL_GROUP_NONE; return true; }
    if (text == "components") { grouping = PANEL_GROUP_COMPONENTS; return true; }
    return false;
}
