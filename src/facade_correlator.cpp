#include "facade_correlator.h"
#include "facade_json_io.h"

#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <filesystem>

FacadeCorrelator::FacadeCorrelator()
    : m_floorSplitZ(0)
    , m_summaryBuilder(new SideSummaryBuilder(FacadeParams(), FacadeBounds(), 0.0))
    , m_hasElements(false)
    , m_hasDetections(false)
    , m_isCorrelated(false)
{
}

FacadeCorrelator::~FacadeCorrelator() {
}

bool FacadeCorrelator::loadElements(const std::string& filename) {
    std::cout << "Loading BIM elements from: " << filename << std::endl;

    FacadeElements elements;
    if (!loadElementsJson(filename, elements)) {
        std::cerr << "Error: Could not load elements file " << filename << std::endl;
        return false;
    }

    setElements(elements);
    std::cout << "Loaded " << m_elements.panels.size() << " panels, "
              << m_elements.doors.size() << " door members, "
              << m_elements.windows.size() << " windows" << std::endl;
    return true;
}

bool FacadeCorrelator::loadDetections(const std::string& filename) {
    std::cout << "Loading detections from: " << filename << std::endl;

    std::vector<Detection> detections;
    if (!loadDetectionsJson(filename, detections)) {
        std::cerr << "Error: Could not load detections file " << filename << std::endl;
        return false;
    }

    setDetections(detections);
    std::cout << "Loaded " << m_detections.size() << " detections" << std::endl;
    return true;
}

void FacadeCorrelator::setElements(const FacadeElements& elements) {
    m_elements = elements;
    m_hasElements = true;
    m_isCorrelated = false;
}

void FacadeCorrelator::setDetections(const std::vector<Detection>& detections) {
    m_detections = detections;
    m_hasDetections = true;
    m_isCorrelated = false;
}

void FacadeCorrelator::reset() {
    m_bounds = FacadeBounds();
    m_floorSplitZ = 0;
    m_openings.clear();
    m_summaryBuilder.reset(new SideSummaryBuilder(m_params, FacadeBounds(), 0.0));
    m_normalizer = SideNormalizer();
    m_normalized.clear();
    m_sideScore = SideScore();
    m_matches.clear();
    m_report = FacadeReport();
    m_lastError.clear();
    m_isCorrelated = false;
}

bool FacadeCorrelator::correlate(const FacadeParams& params) {
    if (!m_hasElements) {
        m_lastError = "No BIM elements loaded";
        std::cerr << "Error: " << m_lastError << std::endl;
        return false;
    }

    m_params = params;
    reset();

    if (!m_hasDetections) {
        std::cout << "No detections loaded, matching will be skipped" << std::endl;
    }

    auto start = std::chrono::high_resolution_clock::now();

    std::cout << "Starting facade correlation..." << std::endl;

    try {
        // 步骤1: 建筑外轮廓
        std::cout << "Step 1: Computing building bounds..." << std::endl;
        computeBounds();

        // 步骤2: 楼层分界
        std::cout << "Step 2: Computing floor split..." << std::endl;
        computeFloorSplit();

        // 步骤3: 门构件分组
        std::cout << "Step 3: Grouping door components..." << std::endl;
        groupDoors();

        // 步骤4: 方位汇总
        std::cout << "Step 4: Classifying elements by side and floor..." << std::endl;
        buildSideSummary();

        // 步骤5: 方位归一化
        std::cout << "Step 5: Normalizing side positions..." << std::endl;
        normalizeSides();

        // 步骤6: 检测方位打分
        std::cout << "Step 6: Scoring detection sides..." << std::endl;
        scoreSides();

        // 步骤7: 跨域匹配
        std::cout << "Step 7: Matching detections to BIM elements..." << std::endl;
        matchDetections();
    } catch (const FacadeError& e) {
        reset();
        m_lastError = e.what();
        std::cerr << "Error: " << m_lastError << std::endl;
        return false;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << "Correlation completed in " << duration.count() << " ms" << std::endl;
    std::cout << "Found " << m_openings.size() << " door openings, "
              << m_normalized.size() << " placed elements, side "
              << sideToString(m_sideScore.side) << std::endl;

    printWarnings();

    m_isCorrelated = true;
    return true;
}

void FacadeCorrelator::computeBounds() {
    BoundsComputer computer(m_params.boundsStrategy);
    m_bounds = computer.compute(m_elements.panels);

    std::cout << "  Bounds X: [" << m_bounds.xmin << ", " << m_bounds.xmax << "]"
              << " Y: [" << m_bounds.ymin << ", " << m_bounds.ymax << "]"
              << " (" << boundsStrategyToString(m_params.boundsStrategy) << ")" << std::endl;
}

void FacadeCorrelator::computeFloorSplit() {
    FloorSplitter splitter(m_params.floorStatistic);
    m_floorSplitZ = splitter.computeSplit(m_elements.panels);

    std::cout << "  Floor split Z: " << m_floorSplitZ
              << " (" << floorStatisticToString(m_params.floorStatistic) << ")" << std::endl;
}

void FacadeCorrelator::groupDoors() {
    for (const auto& member : m_elements.doors) {
        if (member.hasBox) continue;
        std::ostringstream msg;
        msg << "Door member " << member.id << " has no bounding box, skipped";
        m_report.warn(msg.str());
        m_report.skippedElements++;
    }

    DoorComponentGrouper grouper(m_params);
    m_openings = grouper.group(m_elements.doors, m_report);

    int withHeader = 0;
    for (const auto& opening : m_openings) {
        if (opening.hasHeader()) withHeader++;
    }
    std::cout << "  Formed " << m_openings.size() << " door openings ("
              << withHeader << " with header)" << std::endl;
}

void FacadeCorrelator::buildSideSummary() {
    m_summaryBuilder.reset(new SideSummaryBuilder(m_params, m_bounds, m_floorSplitZ));
    m_summaryBuilder->build(m_elements, m_openings, m_report);

    if (m_params.panelGrouping == PANEL_GROUP_COMPONENTS) {
        std::cout << "  Merged panels into " << m_summaryBuilder->getPanelGroups().size()
                  << " panel groups" << std::endl;
    }

    const SideSummary& summary = m_summaryBuilder->getSummary();
    for (FacadeSide side : FACADE_SIDES) {
        const SideRecord& record = summary.side(side);
        std::cout << "  Side " << sideToString(side) << ": "
                  << record.panels.size() << " panels, "
                  << record.windows.size() << " windows, "
                  << record.doors.size() << " doors" << std::endl;
    }
}

void FacadeCorrelator::normalizeSides() {
    const std::vector<ClassifiedElement>& classified = m_summaryBuilder->getClassifiedElements();
    m_normalizer.computeExtents(classified);
    m_normalized = m_normalizer.normalizeAll(classified);

    for (FacadeSide side : FACADE_SIDES) {
        const SideExtent& extent = m_normalizer.getExtent(side);
        if (extent.panelCount == 0 && !SideNormalizer::elementsOnSide(m_normalized, side).empty()) {
            m_report.warn("Side " + sideToString(side) + " has no panels, positions on it are 0");
        }
    }
}

void FacadeCorrelator::scoreSides() {
    DetectionSideScorer scorer(m_params);
    m_sideScore = scorer.score(m_summaryBuilder->getSummary(), m_detections);

    if (m_params.verbose) {
        printSideScoreTable();
    }
    std::cout << "  Classified side: " << sideToString(m_sideScore.side)
              << " (score " << m_sideScore.score << ")" << std::endl;
}

void FacadeCorrelator::matchDetections() {
    CrossDomainMatcher matcher;
    m_matches = matcher.match(m_sideScore.side, m_normalized, m_detections, m_report);

    std::cout << "  Matched " << (m_matches.size() - m_report.unmatchedDetections)
              << "/" << m_matches.size() << " detections" << std::endl;
}

void FacadeCorrelator::printWarnings() const {
    for (const auto& warning : m_report.warnings) {
        std::cout << "Warning: " << warning << std::endl;
    }
}

void FacadeCorrelator::printSideScoreTable() const {
    std::cout << std::endl << std::left << std::setw(18) << "Object";
    for (FacadeSide side : FACADE_SIDES) {
        std::cout << std::right << std::setw(10) << sideToString(side);
    }
    std::cout << std::endl << std::string(60, '-') << std::endl;

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& row : m_sideScore.rows) {
        std::cout << std::left << std::setw(18) << row.name;
        for (FacadeSide side : FACADE_SIDES) {
            if (row.knownLabel) {
                std::cout << std::right << std::setw(10) << row.contribution[side];
            } else {
                std::cout << std::right << std::setw(10) << "---";
            }
        }
        std::cout << std::endl;
    }

    std::cout << std::string(60, '-') << std::endl;
    std::cout << std::left << std::setw(18) << "TOTAL";
    for (FacadeSide side : FACADE_SIDES) {
        std::cout << std::right << std::setw(10) << m_sideScore.scores[side];
    }
    std::cout << std::endl;
    std::cout << "Best: " << sideToString(m_sideScore.side) << " (score="
              << std::setprecision(3) << m_sideScore.score << ")" << std::endl << std::endl;
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}

void FacadeCorrelator::printCorrelationReport() const {
    if (!m_isCorrelated) {
        std::cout << "No correlation results available" << std::endl;
        return;
    }

    std::cout << "\n=== Facade Correlation Report ===" << std::endl;
    std::cout << "Bounds: X [" << m_bounds.xmin << ", " << m_bounds.xmax << "], Y ["
              << m_bounds.ymin << ", " << m_bounds.ymax << "]" << std::endl;
    std::cout << "Floor split Z: " << m_floorSplitZ << std::endl;

    std::cout << "\nDoor openings: " << m_openings.size() << std::endl;
    for (const auto& opening : m_openings) {
        std::cout << "  Door " << opening.id << ": studs " << opening.studLeft.id
                  << "/" << opening.studRight.id << ", header ";
        if (opening.hasHeader()) {
            std::cout << opening.header->id;
        } else {
            std::cout << "none";
        }
        std::cout << ", " << opening.widthMm << " x " << opening.heightMm << " mm, side "
                  << sideToString(m_summaryBuilder->doorSide(opening.id)) << ", "
                  << floorToString(m_summaryBuilder->doorFloor(opening.id)) << std::endl;
    }

    std::cout << "\nSides:" << std::endl;
    for (FacadeSide side : FACADE_SIDES) {
        const SideExtent& extent = m_normalizer.getExtent(side);
        std::cout << "  " << sideToString(side) << ": width " << extent.width << " mm";
        for (const auto& element : SideNormalizer::elementsOnSide(m_normalized, side)) {
            std::cout << " [" << element.tag << ":" << kindToString(element.kind)
                      << " " << element.id << " @" << element.position << "]";
        }
        std::cout << std::endl;
    }

    std::cout << "\nClassified side: " << sideToString(m_sideScore.side)
              << " (score " << m_sideScore.score << ")" << std::endl;
    for (const auto& record : m_matches) {
        std::cout << "  " << record.label << " " << record.detectionId << " -> ";
        if (record.isMatched()) {
            std::cout << *record.elementId << " (tag " << *record.elementTag
                      << ", distance " << *record.distance << ")";
        } else {
            std::cout << "none (" << record.note << ")";
        }
        std::cout << std::endl;
    }

    std::cout << "\nWarnings: " << m_report.warnings.size()
              << " (skipped " << m_report.skippedElements
              << ", unpaired studs " << m_report.unpairedStuds
              << ", openings without header " << m_report.openingsWithoutHeader
              << ", unclassified " << m_report.unclassifiedElements
              << ", unmatched " << m_report.unmatchedDetections << ")" << std::endl;
}

bool FacadeCorrelator::exportToReport(const std::string& filename) const {
    if (!m_isCorrelated) {
        std::cerr << "Error: No correlation results to export" << std::endl;
        return false;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not create report file " << filename << std::endl;
        return false;
    }

    file << "Facade Correlation Report" << std::endl;
    file << "=========================" << std::endl << std::endl;

    file << "Parameters:" << std::endl;
    file << "  Bounds strategy: " << boundsStrategyToString(m_params.boundsStrategy) << std::endl;
    file << "  Floor statistic: " << floorStatisticToString(m_params.floorStatistic) << std::endl;
    file << "  Side mode: " << sideModeToString(m_params.sideMode);
    if (m_params.sideMode == SIDE_EDGE_TOLERANCE) {
        file << " (" << m_params.edgeToleranceMm << " mm)";
    }
    file << std::endl;
    file << "  Panel grouping: " << panelGroupingToString(m_params.panelGrouping) << std::endl;
    file << "  Door grouping: " << doorGroupingToString(m_params.doorGrouping)
         << ", stud pairing: " << studPairingToString(m_params.studPairing) << std::endl;
    file << "  Stud height threshold: " << m_params.studHeightThresholdMm << " mm" << std::endl;
    file << "  Same floor tolerance: " << m_params.sameFloorToleranceMm << " mm" << std::endl;
    file << "  Interior threshold: " << m_params.interiorThreshold << std::endl << std::endl;

    file << "Building bounds: X [" << m_bounds.xmin << ", " << m_bounds.xmax << "], Y ["
         << m_bounds.ymin << ", " << m_bounds.ymax << "]" << std::endl;
    file << "Floor split Z: " << m_floorSplitZ << std::endl << std::endl;

    file << "Door openings (" << m_openings.size() << "):" << std::endl;
    for (const auto& opening : m_openings) {
        file << "  Door " << opening.id << ": studs " << opening.studLeft.id << ", "
             << opening.studRight.id << "; header ";
        if (opening.hasHeader()) {
            file << opening.header->id;
        } else {
            file << "none";
        }
        file << "; width " << opening.widthMm << " mm; height " << opening.heightMm << " mm" << std::endl;
    }
    file << std::endl;

    const SideSummary& summary = m_summaryBuilder->getSummary();
    for (FacadeSide side : FACADE_SIDES) {
        const SideRecord& record = summary.side(side);
        const SideExtent& extent = m_normalizer.getExtent(side);
        file << "Side " << sideToString(side) << ": width " << extent.width << " mm, min X "
             << extent.minX << " mm" << std::endl;
        file << "  Panels: " << record.panels.size() << " (floor1 " << record.panelsFloor1.size()
             << ", floor2 " << record.panelsFloor2.size() << ")" << std::endl;
        file << "  Windows: " << record.windows.size() << " (floor1 " << record.windowsFloor1.size()
             << ", floor2 " << record.windowsFloor2.size() << ")" << std::endl;
        file << "  Doors: " << record.doors.size() << " (floor1 " << record.doorsFloor1.size()
             << ", floor2 " << record.doorsFloor2.size() << ")" << std::endl;
    }
    file << std::endl;

    file << "Classified side: " << sideToString(m_sideScore.side)
         << " (score " << m_sideScore.score << ")" << std::endl;
    for (FacadeSide side : FACADE_SIDES) {
        file << "  " << sideToString(side) << ": " << m_sideScore.scores[side] << std::endl;
    }
    file << std::endl;

    file << "Matches (" << m_matches.size() << "):" << std::endl;
    for (const auto& record : m_matches) {
        file << "  " << record.label << " " << record.detectionId << ": ";
        if (record.isMatched()) {
            file << "element " << *record.elementId << ", tag " << *record.elementTag
                 << ", distance " << std::fixed << std::setprecision(4) << *record.distance;
            file.unsetf(std::ios::floatfield);
            file << std::setprecision(6);
        } else {
            file << "unmatched, " << record.note;
        }
        file << std::endl;
    }
    file << std::endl;

    file << "Warnings (" << m_report.warnings.size() << "):" << std::endl;
    for (const auto& warning : m_report.warnings) {
        file << "  " << warning << std::endl;
    }

    std::cout << "Report exported to: " << filename << std::endl;
    return true;
}

bool FacadeCorrelator::exportJson(const std::string& outputDir) const {
    if (!m_isCorrelated) {
        std::cerr << "Error: No correlation results to export" << std::endl;
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "Error: Could not create output directory " << outputDir
                  << ": " << ec.message() << std::endl;
        return false;
    }

    std::filesystem::path dir(outputDir);
    const SideSummary& summary = m_summaryBuilder->getSummary();

    json matches = matchesToJson(m_sideScore, m_matches, m_report);
    matches["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    json summaryDoc = sideSummaryToJson(summary);
    if (m_params.panelGrouping == PANEL_GROUP_COMPONENTS) {
        summaryDoc["panel_groups"] = panelGroupsToJson(m_summaryBuilder->getPanelGroups());
    }

    bool ok = saveJson(summaryDoc, (dir / "side_objects_summary.json").string())
        && saveJson(doorOutputToJson(m_openings, *m_summaryBuilder), (dir / "door_bim_output.json").string())
        && saveJson(bimExportToJson(m_normalizer, m_normalized, m_bounds, m_floorSplitZ),
                    (dir / "bim_export.json").string())
        && saveJson(sequencesToJson(m_normalized, summary), (dir / "side_element_sequences.json").string())
        && saveJson(matches, (dir / "yolo_bim_matches.json").string());

    if (ok) {
        std::cout << "JSON results exported to: " << outputDir << std::endl;
    }
    return ok;
}
