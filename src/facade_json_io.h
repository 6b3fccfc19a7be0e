#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "facade_types.h"
#include "facade_params.h"
#include "side_summary_builder.h"
#include "side_normalizer.h"
#include "cross_domain_matcher.h"

using json = nlohmann::json;

// 文件读写
bool readJsonFile(const std::string& filename, json& doc);
bool saveJson(const json& doc, const std::string& filename);

// 输入解析: false plus an "Error:" line on std::cerr when the document is malformed
bool elementsFromJson(const json& doc, FacadeElements& elements);
bool detectionsFromJson(const json& doc, std::vector<Detection>& detections);
bool paramsFromJson(const json& doc, FacadeParams& params);

bool loadElementsJson(const std::string& filename, FacadeElements& elements);
bool loadDetectionsJson(const std::string& filename, std::vector<Detection>& detections);
bool loadParamsJson(const std::string& filename, FacadeParams& params);

// 输出构建
json paramsToJson(const FacadeParams& params);
json sideSummaryToJson(const SideSummary& summary);
json panelGroupsToJson(const std::vector<PanelGroup>& groups);
json doorOutputToJson(const std::vector<DoorOpening>& openings, const SideSummaryBuilder& builder);
json bimExportToJson(const SideNormalizer& normalizer, const std::vector<NormalizedElement>& elements,
                     const FacadeBounds& bounds, double floorSplitZ);
json sequencesToJson(const std::vector<NormalizedElement>& elements, const SideSummary& summary);
json matchesToJson(const SideScore& sideScore, const std::vector<MatchRecord>& matches,
                   const FacadeReport& report);

// Detection ids keep the JSON type they were read with
json detectionIdToJson(const std::string& id, bool numericId);
