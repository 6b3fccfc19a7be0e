#pragma once

#include <string>

// Footprint sample points taken from each panel
enum BoundsStrategy {
    BOUNDS_EXTENTS = 0,        // raw xmin/xmax/ymin/ymax
    BOUNDS_MIDPOINTS = 1       // bounding-box center only
};

// Per-element Z statistic used for the floor split and floor membership
enum FloorStatistic {
    FLOOR_STAT_BOTTOM = 0,     // zmin
    FLOOR_STAT_CENTER = 1      // (zmin + zmax) / 2
};

enum SideMode {
    SIDE_NEAREST = 0,          // total mapping to the nearest edge
    SIDE_EDGE_TOLERANCE = 1    // unclassified when farther than edgeToleranceMm from every edge
};

enum DoorGrouping {
    DOOR_GROUP_COMPONENTS = 0, // studs + header -> opening
    DOOR_GROUP_NONE = 1        // every door element is its own opening
};

enum PanelGrouping {
    PANEL_GROUP_NONE = 0,      // every panel element is its own panel
    PANEL_GROUP_COMPONENTS = 1 // panels of one side and floor -> one panel group
};

enum StudPairing {
    STUD_PAIR_SEQUENTIAL = 0,  // walk Z/X-sorted studs, pair neighbours within tolerance
    STUD_PAIR_TWO_ROWS = 1     // exactly four studs: two rows of two
};

// 立面关联参数
struct FacadeParams {
    // 轮廓与楼层
    BoundsStrategy boundsStrategy = BOUNDS_EXTENTS;
    FloorStatistic floorStatistic = FLOOR_STAT_BOTTOM;

    // 方位分类
    SideMode sideMode = SIDE_NEAREST;
    double edgeToleranceMm = 200.0;

    // 墙板分组
    PanelGrouping panelGrouping = PANEL_GROUP_NONE;
    int expectedPanelComponents = 4;          // group size below/above this is reported

    // 门构件分组
    DoorGrouping doorGrouping = DOOR_GROUP_COMPONENTS;
    StudPairing studPairing = STUD_PAIR_SEQUENTIAL;
    double studHeightThresholdMm = 500.0;     // taller than this -> stud
    double sameFloorToleranceMm = 1000.0;     // stud vertical-center difference for a pair

    // 窗户楼层
    bool classifyWindowFloors = true;         // false pins every window to floor 1

    // 检测方位打分 (presence based)
    double doorWeight = 3.0;
    double windowWeight = 2.0;
    double panelWeight = 1.0;
    double interiorThreshold = 0.5;           // best score below this -> INTERIOR

    bool verbose = false;
};

std::string boundsStrategyToString(BoundsStrategy strategy);
std::string floorStatisticToString(FloorStatistic statistic);
std::string sideModeToString(SideMode mode);
std::string doorGroupingToString(DoorGrouping grouping);
std::string studPairingToString(StudPairing pairing);
std::string panelGroupingToString(PanelGrouping grouping);

bool parseBoundsStrategy(const std::string& text, BoundsStrategy& strategy);
bool parseFloorStatistic(const std::string& text, FloorStatistic& statistic);
bool parseSideMode(const std::string& text, SideMode& mode);
bool parseDoorGrouping(const std::string& text, DoorGrouping& grouping);
bool parseStudPairing(const std::string& text, StudPairing& pairing);
bool parsePanelGrouping(const std::string& text, PanelGrouping& grouping);
