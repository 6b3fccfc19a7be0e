#pragma once

#include <string>
#include <vector>

#include "facade_types.h"
#include "facade_params.h"
#include "side_summary_builder.h"

// One detection's contribution to every side
struct SideScoreRow {
    std::string name;                    // label_id
    bool knownLabel;
    double contribution[FACADE_SIDE_COUNT];

    SideScoreRow() : knownLabel(false), contribution{0, 0, 0, 0} {}
};

struct SideScore {
    FacadeSide side;                     // SIDE_INTERIOR when below the threshold
    double score;                        // best total
    double scores[FACADE_SIDE_COUNT];
    std::vector<SideScoreRow> rows;

    SideScore() : side(SIDE_INTERIOR), score(0), scores{0, 0, 0, 0} {}
};

// 检测方位打分: presence-based, door > window > panel
class DetectionSideScorer {
public:
    explicit DetectionSideScorer(const FacadeParams& params = FacadeParams());

    // Adds a type's weight once per detection for every side holding at least
    // one element of that type. Ties go to the first side in A, B, C, D order.
    SideScore score(const SideSummary& summary, const std::vector<Detection>& detections) const;

    double weight(ElementKind kind) const;

    static bool sideHasKind(const SideRecord& record, ElementKind kind);

private:
    FacadeParams m_params;
};

// 跨域匹配: detection -> nearest same type/side/floor element by normalized position
class CrossDomainMatcher {
public:
    CrossDomainMatcher();

    // Always one record per detection, in input order
    std::vector<MatchRecord> match(FacadeSide classifiedSide,
                                   const std::vector<NormalizedElement>& elements,
                                   const std::vector<Detection>& detections,
                                   FacadeReport& report) const;

private:
    MatchRecord matchOne(FacadeSide classifiedSide,
                         const std::vector<NormalizedElement>& elements,
                         const Detection& detection) const;
};
