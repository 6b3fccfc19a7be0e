#include "cross_domain_matcher.h"

#include <cmath>

DetectionSideScorer::DetectionSideScorer(const FacadeParams& params)
    : m_params(params)
{
}

double DetectionSideScorer::weight(ElementKind kind) const {
    switch (kind) {
        case KIND_DOOR: return m_params.doorWeight;
        case KIND_WINDOW: return m_params.windowWeight;
        case KIND_PANEL: return m_params.panelWeight;
    }
    return 0.0;
}

bool DetectionSideScorer::sideHasKind(const SideRecord& record, ElementKind kind) {
    switch (kind) {
        case KIND_DOOR: return !record.doors.empty();
        case KIND_WINDOW: return !record.windows.empty();
        case KIND_PANEL: return !record.panels.empty();
    }
    return false;
}

SideScore DetectionSideScorer::score(const SideSummary& summary, const std::vector<Detection>& detections) const {
    SideScore result;

    if (detections.empty()) {
        return result;
    }

    for (const auto& detection : detections) {
        SideScoreRow row;
        row.name = detection.label + "_" + detection.id;

        ElementKind kind;
        if (labelToKind(detection.label, kind)) {
            row.knownLabel = true;
            for (FacadeSide side : FACADE_SIDES) {
                if (sideHasKind(summary.side(side), kind)) {
                    row.contribution[side] = weight(kind);
                    result.scores[side] += weight(kind);
                }
            }
        }
        result.rows.push_back(row);
    }

    FacadeSide best = SIDE_A;
    for (FacadeSide side : FACADE_SIDES) {
        if (result.scores[side] > result.scores[best]) {
            best = side;
        }
    }

    result.score = result.scores[best];
    result.side = result.score < m_params.interiorThreshold ? SIDE_INTERIOR : best;
    return result;
}

CrossDomainMatcher::CrossDomainMatcher() {
}

std::vector<MatchRecord> CrossDomainMatcher::match(FacadeSide classifiedSide,
                                                   const std::vector<NormalizedElement>& elements,
                                                   const std::vector<Detection>& detections,
                                                   FacadeReport& report) const {
    std::vector<MatchRecord> records;
    records.reserve(detections.size());

    for (const auto& detection : detections) {
        MatchRecord record = matchOne(classifiedSide, elements, detection);
        if (!record.isMatched()) {
            report.unmatchedDetections++;
        }
        records.push_back(record);
    }

    return records;
}

MatchRecord CrossDomainMatcher::matchOne(FacadeSide classifiedSide,
                                         const std::vector<NormalizedElement>& elements,
                                         const Detection& detection) const {
    MatchRecord record;
    record.detectionId = detection.id;
    record.numericId = detection.numericId;
    record.label = detection.label;

    if (classifiedSide != SIDE_A && classifiedSide != SIDE_B &&
        classifiedSide != SIDE_C && classifiedSide != SIDE_D) {
        record.note = "non-exterior / unclassifiable detection set";
        return record;
    }

    ElementKind kind;
    if (!labelToKind(detection.label, kind)) {
        record.note = "unknown label";
        return record;
    }

    const NormalizedElement* best = nullptr;
    double bestDistance = 0.0;

    for (const auto& element : elements) {
        if (element.side != classifiedSide || element.kind != kind) continue;
        if (detection.floor == FLOOR_UNKNOWN || element.floor != detection.floor) continue;

        double distance = std::abs(element.position - detection.xNorm);
        // first found wins on equal distance
        if (best == nullptr || distance < bestDistance) {
            best = &element;
            bestDistance = distance;
        }
    }

    if (best == nullptr) {
        record.note = "no candidates for type/side/floor";
        return record;
    }

    record.elementId = best->id;
    record.elementTag = best->tag;
    record.distance = bestDistance;
    return record;
}
