#pragma once

#include <vector>
#include <Eigen/Dense>

#include "facade_types.h"
#include "facade_params.h"
#include "side_classifier.h"
#include "floor_splitter.h"

// Members of one facade side, split by floor
struct SideRecord {
    std::vector<long> panels;
    std::vector<long> panelsFloor1;
    std::vector<long> panelsFloor2;
    std::vector<long> windows;
    std::vector<long> windowsFloor1;
    std::vector<long> windowsFloor2;
    std::vector<int> doors;             // DoorOpening ids
    std::vector<int> doorsFloor1;
    std::vector<int> doorsFloor2;
};

struct SideSummary {
    SideRecord sides[FACADE_SIDE_COUNT];

    // edge-tolerance mode only
    std::vector<long> unclassifiedPanels;
    std::vector<long> unclassifiedWindows;
    std::vector<int> unclassifiedDoors;

    SideRecord& side(FacadeSide s) { return sides[static_cast<int>(s)]; }
    const SideRecord& side(FacadeSide s) const { return sides[static_cast<int>(s)]; }
};

// One element (or door opening) with its side, floor and absolute X extent
struct ClassifiedElement {
    ElementKind kind;
    long id;
    FacadeSide side;
    FloorLevel floor;
    double xmin;
    double xmax;
};

// 墙板组: one panel as seen by the detector, made of one or more panel elements
struct PanelGroup {
    long id;                            // element id, or 1-based group id in component mode
    FacadeSide side;
    FloorLevel floor;
    std::vector<long> memberIds;
    Eigen::Vector3d minBound;           // union of the member boxes
    Eigen::Vector3d maxBound;

    PanelGroup() : id(0), side(SIDE_A), floor(FLOOR_UNKNOWN),
                   minBound(Eigen::Vector3d::Zero()), maxBound(Eigen::Vector3d::Zero()) {}

    int componentCount() const { return static_cast<int>(memberIds.size()); }
};

// 方位汇总: applies SideClassifier and FloorSplitter to panels, windows and openings
class SideSummaryBuilder {
public:
    SideSummaryBuilder(const FacadeParams& params, const FacadeBounds& bounds, double floorSplitZ);

    // Elements without a bounding box are skipped (counted once per element)
    void build(const FacadeElements& elements, const std::vector<DoorOpening>& openings,
               FacadeReport& report);

    const SideSummary& getSummary() const { return m_summary; }
    const std::vector<ClassifiedElement>& getClassifiedElements() const { return m_classified; }
    const std::vector<PanelGroup>& getPanelGroups() const { return m_panelGroups; }

    // Side/floor assigned to a door opening, SIDE_UNCLASSIFIED when not found
    FacadeSide doorSide(int openingId) const;
    FloorLevel doorFloor(int openingId) const;

private:
    // true when the panel was placed on a side
    bool addPanel(const BimElement& panel, FacadeReport& report);
    void addWindow(const BimElement& window, FacadeReport& report);
    void addDoor(const DoorOpening& opening, FacadeReport& report);

    // placed[i] is the element behind the i-th classified panel
    void groupPanels(const std::vector<const BimElement*>& placed, FacadeReport& report);
    void mergeComponents(const std::vector<const BimElement*>& placed, FacadeReport& report);

    FacadeParams m_params;
    FacadeBounds m_bounds;
    double m_floorSplitZ;
    SideClassifier m_sideClassifier;
    FloorSplitter m_floorSplitter;

    SideSummary m_summary;
    std::vector<ClassifiedElement> m_classified;
    std::vector<PanelGroup> m_panelGroups;
};
