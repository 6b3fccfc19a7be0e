#include "facade_json_io.h"

#include <fstream>
#include <iomanip>
#include <iostream>

static const char* BBOX_KEYS[6] = { "xmin", "xmax", "ymin", "ymax", "zmin", "zmax" };

static bool parseElementList(const json& list, const std::string& group, std::vector<BimElement>& out) {
    if (!list.is_array()) {
        std::cerr << "Error: \"" << group << "\" must be an array" << std::endl;
        return false;
    }

    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_integer()) {
            std::cerr << "Error: every entry of \"" << group << "\" needs an integer id" << std::endl;
            return false;
        }

        BimElement element;
        element.id = item["id"].get<long>();

        if (item.contains("bbox") && !item["bbox"].is_null()) {
            const json& bbox = item["bbox"];
            double values[6];
            for (int k = 0; k < 6; ++k) {
                if (!bbox.contains(BBOX_KEYS[k]) || !bbox[BBOX_KEYS[k]].is_number()) {
                    std::cerr << "Error: element " << element.id << " in \"" << group
                              << "\" has a bbox without numeric " << BBOX_KEYS[k] << std::endl;
                    return false;
                }
                values[k] = bbox[BBOX_KEYS[k]].get<double>();
            }
            element = BimElement(element.id, values[0], values[1], values[2], values[3], values[4], values[5]);
        }

        out.push_back(element);
    }
    return true;
}

// 1, 2, 1.0, 2.0, "1", "2", "floor1", "floor2"
static bool parseDetectionFloor(const json& value, FloorLevel& floor) {
    double level = 0;
    if (value.is_number()) {
        level = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text == "1" || text == "floor1") level = 1;
        else if (text == "2" || text == "floor2") level = 2;
    }

    if (level == 1) { floor = FLOOR_1; return true; }
    if (level == 2) { floor = FLOOR_2; return true; }
    floor = FLOOR_UNKNOWN;
    return false;
}

// First key present among the aliases, nullptr when none
static const json* findGroup(const json& doc, const char* const* aliases, int count) {
    for (int i = 0; i < count; ++i) {
        if (doc.contains(aliases[i])) {
            return &doc[aliases[i]];
        }
    }
    return nullptr;
}

bool readJsonFile(const std::string& filename, json& doc) {
    std::ifstream input(filename);
    if (!input.is_open()) {
        std::cerr << "Error: Could not open file " << filename << std::endl;
        return false;
    }

    try {
        input >> doc;
    } catch (const json::parse_error& e) {
        std::cerr << "Error: Could not parse " << filename << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool saveJson(const json& doc, const std::string& filename) {
    std::ofstream output(filename);
    if (!output.is_open()) {
        std::cerr << "Error: Could not write file " << filename << std::endl;
        return false;
    }

    output << std::setw(2) << doc << std::endl;
    return output.good();
}

bool elementsFromJson(const json& doc, FacadeElements& elements) {
    if (!doc.is_object()) {
        std::cerr << "Error: elements document must be a JSON object" << std::endl;
        return false;
    }

    static const char* const PANEL_KEYS[] = { "wall_panels", "panels", "wall-panels" };
    static const char* const DOOR_KEYS[] = { "door", "doors" };
    static const char* const WINDOW_KEYS[] = { "windows", "window" };

    elements = FacadeElements();

    const json* panels = findGroup(doc, PANEL_KEYS, 3);
    const json* doors = findGroup(doc, DOOR_KEYS, 2);
    const json* windows = findGroup(doc, WINDOW_KEYS, 2);

    if (panels && !parseElementList(*panels, "wall_panels", elements.panels)) return false;
    if (doors && !parseElementList(*doors, "door", elements.doors)) return false;
    if (windows && !parseElementList(*windows, "windows", elements.windows)) return false;

    return true;
}

bool detectionsFromJson(const json& doc, std::vector<Detection>& detections) {
    const json* list = &doc;
    if (doc.is_object() && doc.contains("detections")) {
        list = &doc["detections"];
    }
    if (!list->is_array()) {
        std::cerr << "Error: detections must be a JSON array" << std::endl;
        return false;
    }

    detections.clear();
    for (size_t i = 0; i < list->size(); ++i) {
        const json& item = (*list)[i];
        if (!item.is_object()) {
            std::cerr << "Error: detection " << i << " is not an object" << std::endl;
            return false;
        }

        Detection detection;

        if (!item.contains("id")) {
            detection.id = std::to_string(i);
            detection.numericId = true;
        } else if (item["id"].is_string()) {
            detection.id = item["id"].get<std::string>();
        } else if (item["id"].is_number()) {
            detection.id = item["id"].dump();
            detection.numericId = true;
        } else {
            std::cerr << "Error: detection " << i << " id must be a number or a string" << std::endl;
            return false;
        }

        if (!item.contains("label") || !item["label"].is_string()) {
            std::cerr << "Error: detection " << detection.id << " has no label" << std::endl;
            return false;
        }
        detection.label = item["label"].get<std::string>();

        if (item.contains("floor") && !item["floor"].is_null() &&
            !parseDetectionFloor(item["floor"], detection.floor)) {
            std::cerr << "Warning: detection " << detection.id << " has unusable floor "
                      << item["floor"].dump() << ", it will not be matched" << std::endl;
        }

        if (!item.contains("center_xy_norm") || !item["center_xy_norm"].is_array() ||
            item["center_xy_norm"].empty() || !item["center_xy_norm"][0].is_number()) {
            std::cerr << "Error: detection " << detection.id << " has no center_xy_norm" << std::endl;
            return false;
        }
        const json& center = item["center_xy_norm"];
        detection.xNorm = center[0].get<double>();
        if (center.size() > 1 && center[1].is_number()) {
            detection.yNorm = center[1].get<double>();
        }

        detections.push_back(detection);
    }
    return true;
}

bool paramsFromJson(const json& doc, FacadeParams& params) {
    if (!doc.is_object()) {
        std::cerr << "Error: configuration must be a JSON object" << std::endl;
        return false;
    }

    try {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string& key = it.key();
            const json& value = it.value();
            bool ok = true;

            if (key == "bounds_strategy") {
                ok = parseBoundsStrategy(value.get<std::string>(), params.boundsStrategy);
            } else if (key == "floor_statistic") {
                ok = parseFloorStatistic(value.get<std::string>(), params.floorStatistic);
            } else if (key == "side_mode") {
                ok = parseSideMode(value.get<std::string>(), params.sideMode);
            } else if (key == "edge_tolerance_mm") {
                params.edgeToleranceMm = value.get<double>();
            } else if (key == "panel_grouping") {
                ok = parsePanelGrouping(value.get<std::string>(), params.panelGrouping);
            } else if (key == "expected_panel_components") {
                params.expectedPanelComponents = value.get<int>();
            } else if (key == "door_grouping") {
                ok = parseDoorGrouping(value.get<std::string>(), params.doorGrouping);
            } else if (key == "stud_pairing") {
                ok = parseStudPairing(value.get<std::string>(), params.studPairing);
            } else if (key == "stud_height_threshold_mm") {
                params.studHeightThresholdMm = value.get<double>();
            } else if (key == "same_floor_tolerance_mm") {
                params.sameFloorToleranceMm = value.get<double>();
            } else if (key == "classify_window_floors") {
                params.classifyWindowFloors = value.get<bool>();
            } else if (key == "door_weight") {
                params.doorWeight = value.get<double>();
            } else if (key == "window_weight") {
                params.windowWeight = value.get<double>();
            } else if (key == "panel_weight") {
                params.panelWeight = value.get<double>();
            } else if (key == "interior_threshold") {
                params.interiorThreshold = value.get<double>();
            } else if (key == "verbose") {
                params.verbose = value.get<bool>();
            } else {
                std::cerr << "Warning: unknown configuration key \"" << key << "\" ignored" << std::endl;
            }

            if (!ok) {
                std::cerr << "Error: invalid value " << value.dump() << " for \"" << key << "\"" << std::endl;
                return false;
            }
        }
    } catch (const json::type_error& e) {
        std::cerr << "Error: configuration value has the wrong type: " << e.what() << std::endl;
        return false;
    }

    return true;
}

bool loadElementsJson(const std::string& filename, FacadeElements& elements) {
    json doc;
    if (!readJsonFile(filename, doc)) return false;
    return elementsFromJson(doc, elements);
}

bool loadDetectionsJson(const std::string& filename, std::vector<Detection>& detections) {
    json doc;
    if (!readJsonFile(filename, doc)) return false;
    return detectionsFromJson(doc, detections);
}

bool loadParamsJson(const std::string& filename, FacadeParams& params) {
    json doc;
    if (!readJsonFile(filename, doc)) return false;
    return paramsFromJson(doc, params);
}

json paramsToJson(const FacadeParams& params) {
    json doc;
    doc["bounds_strategy"] = boundsStrategyToString(params.boundsStrategy);
    doc["floor_statistic"] = floorStatisticToString(params.floorStatistic);
    doc["side_mode"] = sideModeToString(params.sideMode);
    doc["edge_tolerance_mm"] = params.edgeToleranceMm;
    doc["panel_grouping"] = panelGroupingToString(params.panelGrouping);
    doc["expected_panel_components"] = params.expectedPanelComponents;
    doc["door_grouping"] = doorGroupingToString(params.doorGrouping);
    doc["stud_pairing"] = studPairingToString(params.studPairing);
    doc["stud_height_threshold_mm"] = params.studHeightThresholdMm;
    doc["same_floor_tolerance_mm"] = params.sameFloorToleranceMm;
    doc["classify_window_floors"] = params.classifyWindowFloors;
    doc["door_weight"] = params.doorWeight;
    doc["window_weight"] = params.windowWeight;
    doc["panel_weight"] = params.panelWeight;
    doc["interior_threshold"] = params.interiorThreshold;
    doc["verbose"] = params.verbose;
    return doc;
}

json sideSummaryToJson(const SideSummary& summary) {
    json doc = json::object();

    for (FacadeSide side : FACADE_SIDES) {
        const SideRecord& record = summary.side(side);
        json entry;
        entry["panels"] = record.panels;
        entry["panels_floor1"] = record.panelsFloor1;
        entry["panels_floor2"] = record.panelsFloor2;
        entry["windows"] = record.windows;
        entry["windows_floor1"] = record.windowsFloor1;
        entry["windows_floor2"] = record.windowsFloor2;
        entry["door"] = record.doors;
        entry["door_floor1"] = record.doorsFloor1;
        entry["door_floor2"] = record.doorsFloor2;
        doc[sideToString(side)] = entry;
    }

    if (!summary.unclassifiedPanels.empty() || !summary.unclassifiedWindows.empty() ||
        !summary.unclassifiedDoors.empty()) {
        json unclassified;
        unclassified["panels"] = summary.unclassifiedPanels;
        unclassified["windows"] = summary.unclassifiedWindows;
        unclassified["door"] = summary.unclassifiedDoors;
        doc["unclassified"] = unclassified;
    }

    return doc;
}

json panelGroupsToJson(const std::vector<PanelGroup>& groups) {
    json doc = json::array();

    for (const auto& group : groups) {
        json entry;
        entry["id"] = group.id;
        entry["side"] = sideToString(group.side);
        entry["floor"] = floorToString(group.floor);
        entry["element_ids"] = group.memberIds;
        entry["component_count"] = group.componentCount();
        entry["xmin"] = group.minBound.x();
        entry["xmax"] = group.maxBound.x();
        entry["ymin"] = group.minBound.y();
        entry["ymax"] = group.maxBound.y();
        entry["zmin"] = group.minBound.z();
        entry["zmax"] = group.maxBound.z();
        doc.push_back(entry);
    }

    return doc;
}

json doorOutputToJson(const std::vector<DoorOpening>& openings, const SideSummaryBuilder& builder) {
    json doc = json::array();

    for (const auto& opening : openings) {
        json entry;
        entry["door"] = opening.id;
        entry["stud_left"] = opening.studLeft.id;
        entry["stud_right"] = opening.studRight.id;
        entry["header"] = opening.hasHeader() ? json(opening.header->id) : json(nullptr);
        entry["width_mm"] = opening.widthMm;
        entry["height_mm"] = opening.heightMm;
        entry["side"] = sideToString(builder.doorSide(opening.id));
        entry["floor"] = floorToString(builder.doorFloor(opening.id));
        doc.push_back(entry);
    }

    return doc;
}

json bimExportToJson(const SideNormalizer& normalizer, const std::vector<NormalizedElement>& elements,
                     const FacadeBounds& bounds, double floorSplitZ) {
    json doc;
    doc["floor_split_z"] = floorSplitZ;
    doc["bounds"] = { { "xmin", bounds.xmin }, { "xmax", bounds.xmax },
                      { "ymin", bounds.ymin }, { "ymax", bounds.ymax } };

    json sides = json::object();
    for (FacadeSide side : FACADE_SIDES) {
        const SideExtent& extent = normalizer.getExtent(side);
        std::vector<NormalizedElement> onSide = SideNormalizer::elementsOnSide(elements, side);

        json list = json::array();
        for (const auto& element : onSide) {
            json entry;
            entry["tag"] = element.tag;
            entry["type"] = kindToString(element.kind);
            entry["id"] = element.id;
            entry["floor"] = floorToString(element.floor);
            entry["xmin"] = element.xmin;
            entry["xmax"] = element.xmax;
            entry["position"] = element.position;
            list.push_back(entry);
        }

        json entry;
        entry["width_mm"] = extent.width;
        entry["min_x_mm"] = extent.minX;
        entry["element_count"] = onSide.size();
        entry["elements"] = list;
        sides[sideToString(side)] = entry;
    }
    doc["sides"] = sides;

    return doc;
}

json sequencesToJson(const std::vector<NormalizedElement>& elements, const SideSummary& summary) {
    size_t doors = 0, windows = 0, panels = 0;
    json sides = json::object();

    for (FacadeSide side : FACADE_SIDES) {
        const SideRecord& record = summary.side(side);
        doors += record.doors.size();
        windows += record.windows.size();
        panels += record.panels.size();

        json sequence = json::array();
        for (const auto& element : SideNormalizer::elementsOnSide(elements, side)) {
            sequence.push_back(kindToString(element.kind));
        }
        sides[sideToString(side)] = sequence;
    }

    json doc;
    doc["summary"] = { { "Doors", doors }, { "Windows", windows }, { "Panels", panels } };
    doc["sides"] = sides;
    return doc;
}

json detectionIdToJson(const std::string& id, bool numericId) {
    if (numericId) {
        return json::parse(id);
    }
    return json(id);
}

json matchesToJson(const SideScore& sideScore, const std::vector<MatchRecord>& matches,
                   const FacadeReport& report) {
    json doc;
    doc["classified_side"] = sideToString(sideScore.side);
    doc["side_score"] = sideScore.score;

    json scores = json::object();
    for (FacadeSide side : FACADE_SIDES) {
        scores[sideToString(side)] = sideScore.scores[side];
    }
    doc["side_scores"] = scores;

    json list = json::array();
    int matched = 0;
    for (const auto& record : matches) {
        json entry;
        entry["yolo_id"] = detectionIdToJson(record.detectionId, record.numericId);
        entry["label"] = record.label;
        entry["bim_id"] = record.elementId ? json(*record.elementId) : json(nullptr);
        entry["bim_tag"] = record.elementTag ? json(*record.elementTag) : json(nullptr);
        entry["distance"] = record.distance ? json(*record.distance) : json(nullptr);
        if (!record.note.empty()) {
            entry["note"] = record.note;
        }
        if (record.isMatched()) matched++;
        list.push_back(entry);
    }
    doc["matches"] = list;
    doc["matched_count"] = matched;
    doc["warnings"] = report.warnings;

    return doc;
}
