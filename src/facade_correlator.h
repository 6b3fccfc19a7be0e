#pragma once

#include <memory>
#include <string>
#include <vector>

#include "facade_types.h"
#include "facade_params.h"
#include "bounds_computer.h"
#include "floor_splitter.h"
#include "side_classifier.h"
#include "door_component_grouper.h"
#include "side_summary_builder.h"
#include "side_normalizer.h"
#include "cross_domain_matcher.h"

// 立面关联器: BIM elements + image detections -> sides, floors, door openings, matches
class FacadeCorrelator {
public:
    FacadeCorrelator();
    ~FacadeCorrelator();

    // 主要接口
    bool loadElements(const std::string& filename);
    bool loadDetections(const std::string& filename);
    void setElements(const FacadeElements& elements);
    void setDetections(const std::vector<Detection>& detections);

    // Runs the whole pipeline. On a fatal precondition prints "Error: ..." and
    // returns false; the message stays available through getLastError().
    bool correlate(const FacadeParams& params = FacadeParams());

    // 结果获取
    const FacadeBounds& getBounds() const { return m_bounds; }
    double getFloorSplitZ() const { return m_floorSplitZ; }
    const std::vector<DoorOpening>& getDoorOpenings() const { return m_openings; }
    const SideSummary& getSideSummary() const { return m_summaryBuilder->getSummary(); }
    const SideSummaryBuilder& getSideSummaryBuilder() const { return *m_summaryBuilder; }
    const std::vector<NormalizedElement>& getNormalizedElements() const { return m_normalized; }
    const SideNormalizer& getSideNormalizer() const { return m_normalizer; }
    const SideScore& getSideScore() const { return m_sideScore; }
    const std::vector<MatchRecord>& getMatches() const { return m_matches; }
    const FacadeReport& getReport() const { return m_report; }
    const std::string& getLastError() const { return m_lastError; }
    bool isCorrelated() const { return m_isCorrelated; }

    // 参数
    void setParams(const FacadeParams& params) { m_params = params; }
    const FacadeParams& getParams() const { return m_params; }

    // 结果分析
    void printCorrelationReport() const;
    void printSideScoreTable() const;
    bool exportToReport(const std::string& filename) const;

    // side_objects_summary, door_bim_output, bim_export, side_element_sequences, yolo_bim_matches
    bool exportJson(const std::string& outputDir) const;

private:
    // 核心步骤
    void computeBounds();
    void computeFloorSplit();
    void groupDoors();
    void buildSideSummary();
    void normalizeSides();
    void scoreSides();
    void matchDetections();

    void reset();
    void printWarnings() const;

private:
    FacadeElements m_elements;
    std::vector<Detection> m_detections;
    FacadeParams m_params;

    FacadeBounds m_bounds;
    double m_floorSplitZ;
    std::vector<DoorOpening> m_openings;
    std::shared_ptr<SideSummaryBuilder> m_summaryBuilder;
    SideNormalizer m_normalizer;
    std::vector<NormalizedElement> m_normalized;
    SideScore m_sideScore;
    std::vector<MatchRecord> m_matches;

    FacadeReport m_report;
    std::string m_lastError;

    // 状态标志
    bool m_hasElements;
    bool m_hasDetections;
    bool m_isCorrelated;
};
