#include "facade_types.h"

#include <algorithm>
#include <cctype>

std::string sideToString(FacadeSide side) {
    switch (side) {
        case SIDE_A: return "A";
        case SIDE_B: return "B";
        case SIDE_C: return "C";
        case SIDE_D: return "D";
        case SIDE_UNCLASSIFIED: return "UNCLASSIFIED";
        case SIDE_INTERIOR: return "INTERIOR";
    }
    return "UNKNOWN";
}

std::string floorToString(FloorLevel floor) {
    switch (floor) {
        case FLOOR_1: return "floor1";
        case FLOOR_2: return "floor2";
        default: return "unknown";
    }
}

std::string kindToString(ElementKind kind) {
    switch (kind) {
        case KIND_PANEL: return "wall_panels";
        case KIND_DOOR: return "door";
        case KIND_WINDOW: return "window";
    }
    return "unknown";
}

bool labelToKind(const std::string& label, ElementKind& kind) {
    std::string key = label;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "door" || key == "doors") {
        kind = KIND_DOOR;
        return true;
    }
    if (key == "window" || key == "windows") {
        kind = KIND_WINDOW;
        return true;
    }
    if (key == "wall_panels" || key == "wall-panels" || key == "wall_panel" ||
        key == "wall-panel" || key == "panel" || key == "panels") {
        kind = KIND_PANEL;
        return true;
    }
    return false;
}

std::vector<const BimElement*> DoorOpening::members() const {
    std::vector<const BimElement*> result;
    result.push_back(&studLeft);
    if (composite) {
        result.push_back(&studRight);
    }
    if (header) {
        result.push_back(&(*header));
    }
    return result;
}

double DoorOpening::xmin() const {
    double value = studLeft.minBound.x();
    for (const BimElement* member : members()) {
        value = std::min(value, member->minBound.x());
    }
    return value;
}

double DoorOpening::xmax() const {
    double value = studLeft.maxBound.x();
    for (const BimElement* member : members()) {
        value = std::max(value, member->maxBound.x());
    }
    return value;
}
