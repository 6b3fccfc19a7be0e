#include "side_summary_builder.h"

#include <iostream>
#include <sstream>

SideSummaryBuilder::SideSummaryBuilder(const FacadeParams& params, const FacadeBounds& bounds,
                                       double floorSplitZ)
    : m_params(params)
    , m_bounds(bounds)
    , m_floorSplitZ(floorSplitZ)
    , m_sideClassifier(params.sideMode, params.edgeToleranceMm)
    , m_floorSplitter(params.floorStatistic)
{
}

void SideSummaryBuilder::build(const FacadeElements& elements, const std::vector<DoorOpening>& openings,
                               FacadeReport& report) {
    m_summary = SideSummary();
    m_classified.clear();
    m_panelGroups.clear();

    std::vector<const BimElement*> placed;
    for (const auto& panel : elements.panels) {
        if (addPanel(panel, report)) {
            placed.push_back(&panel);
        }
    }
    groupPanels(placed, report);

    for (const auto& window : elements.windows) {
        addWindow(window, report);
    }
    for (const auto& opening : openings) {
        addDoor(opening, report);
    }

    if (m_params.verbose) {
        for (FacadeSide s : FACADE_SIDES) {
            const SideRecord& record = m_summary.side(s);
            std::cout << "  Side " << sideToString(s) << ": " << record.panels.size()
                      << " panels (floor1=" << record.panelsFloor1.size()
                      << ", floor2=" << record.panelsFloor2.size() << "), "
                      << record.windows.size() << " windows, "
                      << record.doors.size() << " doors" << std::endl;
        }
    }
}

FacadeSide SideSummaryBuilder::doorSide(int openingId) const {
    for (const auto& element : m_classified) {
        if (element.kind == KIND_DOOR && element.id == openingId) {
            return element.side;
        }
    }
    return SIDE_UNCLASSIFIED;
}

FloorLevel SideSummaryBuilder::doorFloor(int openingId) const {
    for (const auto& element : m_classified) {
        if (element.kind == KIND_DOOR && element.id == openingId) {
            return element.floor;
        }
    }
    return FLOOR_UNKNOWN;
}

bool SideSummaryBuilder::addPanel(const BimElement& panel, FacadeReport& report) {
    if (!panel.hasBox) {
        std::ostringstream msg;
        msg << "Panel " << panel.id << " has no bounding box, skipped";
        report.warn(msg.str());
        report.skippedElements++;
        return false;
    }

    FacadeSide side = m_sideClassifier.classify(panel.centerX(), panel.centerY(), m_bounds);
    FloorLevel floor = m_floorSplitter.classify(m_floorSplitter.statistic(panel), m_floorSplitZ);

    if (side == SIDE_UNCLASSIFIED) {
        std::ostringstream msg;
        msg << "Panel " << panel.id << " is farther than " << m_params.edgeToleranceMm
            << " mm from every facade edge, unclassified";
        report.warn(msg.str());
        report.unclassifiedElements++;
        m_summary.unclassifiedPanels.push_back(panel.id);
        return false;
    }

    SideRecord& record = m_summary.side(side);
    record.panels.push_back(panel.id);
    if (floor == FLOOR_1) {
        record.panelsFloor1.push_back(panel.id);
    } else {
        record.panelsFloor2.push_back(panel.id);
    }

    ClassifiedElement element = { KIND_PANEL, panel.id, side, floor,
                                  panel.minBound.x(), panel.maxBound.x() };
    m_classified.push_back(element);
    return true;
}

void SideSummaryBuilder::addWindow(const BimElement& window, FacadeReport& report) {
    if (!window.hasBox) {
        std::ostringstream msg;
        msg << "Window " << window.id << " has no bounding box, skipped";
        report.warn(msg.str());
        report.skippedElements++;
        return;
    }

    FacadeSide side = m_sideClassifier.classify(window.centerX(), window.centerY(), m_bounds);
    FloorLevel floor = FLOOR_1;
    if (m_params.classifyWindowFloors) {
        floor = m_floorSplitter.classify(m_floorSplitter.statistic(window), m_floorSplitZ);
    }

    if (side == SIDE_UNCLASSIFIED) {
        std::ostringstream msg;
        msg << "Window " << window.id << " is farther than " << m_params.edgeToleranceMm
            << " mm from every facade edge, unclassified";
        report.warn(msg.str());
        report.unclassifiedElements++;
        m_summary.unclassifiedWindows.push_back(window.id);
        return;
    }

    SideRecord& record = m_summary.side(side);
    record.windows.push_back(window.id);
    if (floor == FLOOR_1) {
        record.windowsFloor1.push_back(window.id);
    } else {
        record.windowsFloor2.push_back(window.id);
    }

    ClassifiedElement element = { KIND_WINDOW, window.id, side, floor,
                                  window.minBound.x(), window.maxBound.x() };
    m_classified.push_back(element);
}

void SideSummaryBuilder::addDoor(const DoorOpening& opening, FacadeReport& report) {
    FacadeSide side = m_sideClassifier.classify(opening.centerX(), opening.centerY(), m_bounds);
    FloorLevel floor = m_floorSplitter.classify(m_floorSplitter.statistic(opening), m_floorSplitZ);

    if (side == SIDE_UNCLASSIFIED) {
        std::ostringstream msg;
        msg << "Door " << opening.id << " is farther than " << m_params.edgeToleranceMm
            << " mm from every facade edge, unclassified";
        report.warn(msg.str());
        report.unclassifiedElements++;
        m_summary.unclassifiedDoors.push_back(opening.id);
        return;
    }

    SideRecord& record = m_summary.side(side);
    record.doors.push_back(opening.id);
    if (floor == FLOOR_1) {
        record.doorsFloor1.push_back(opening.id);
    } else {
        record.doorsFloor2.push_back(opening.id);
    }

    ClassifiedElement element = { KIND_DOOR, opening.id, side, floor,
                                  opening.xmin(), opening.xmax() };
    m_classified.push_back(element);
}

void SideSummaryBuilder::groupPanels(const std::vector<const BimElement*>& placed, FacadeReport& report) {
    if (m_params.panelGrouping == PANEL_GROUP_COMPONENTS) {
        mergeComponents(placed, report);
        return;
    }

    for (size_t i = 0; i < placed.size(); ++i) {
        PanelGroup group;
        group.id = placed[i]->id;
        group.side = m_classified[i].side;
        group.floor = m_classified[i].floor;
        group.memberIds.push_back(placed[i]->id);
        group.minBound = placed[i]->minBound;
        group.maxBound = placed[i]->maxBound;
        m_panelGroups.push_back(group);
    }
}

void SideSummaryBuilder::mergeComponents(const std::vector<const BimElement*>& placed, FacadeReport& report) {
    static const FloorLevel FLOORS[2] = { FLOOR_1, FLOOR_2 };

    std::vector<ClassifiedElement> merged;
    long nextId = 1;

    for (FacadeSide side : FACADE_SIDES) {
        SideRecord& record = m_summary.side(side);
        record.panels.clear();
        record.panelsFloor1.clear();
        record.panelsFloor2.clear();

        for (FloorLevel floor : FLOORS) {
            PanelGroup group;
            group.id = nextId;
            group.side = side;
            group.floor = floor;

            Eigen::AlignedBox3d box;
            for (size_t i = 0; i < placed.size(); ++i) {
                if (m_classified[i].side != side || m_classified[i].floor != floor) continue;
                group.memberIds.push_back(placed[i]->id);
                box.extend(placed[i]->minBound);
                box.extend(placed[i]->maxBound);
            }
            if (group.memberIds.empty()) continue;

            if (group.componentCount() != m_params.expectedPanelComponents) {
                std::ostringstream msg;
                msg << "Panel group " << group.id << " (side " << sideToString(side) << ", "
                    << floorToString(floor) << ") has " << group.componentCount()
                    << " components, expected " << m_params.expectedPanelComponents;
                report.warn(msg.str());
            }

            group.minBound = box.min();
            group.maxBound = box.max();
            m_panelGroups.push_back(group);

            record.panels.push_back(group.id);
            if (floor == FLOOR_1) {
                record.panelsFloor1.push_back(group.id);
            } else {
                record.panelsFloor2.push_back(group.id);
            }

            ClassifiedElement element = { KIND_PANEL, group.id, side, floor,
                                          box.min().x(), box.max().x() };
            merged.push_back(element);
            nextId++;
        }
    }

    // the groups take the place of their member panels
    m_classified.erase(m_classified.begin(), m_classified.begin() + static_cast<std::ptrdiff_t>(placed.size()));
    m_classified.insert(m_classified.begin(), merged.begin(), merged.end());
}
