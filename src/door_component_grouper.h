#pragma once

#include <memory>
#include <vector>

#include "facade_types.h"
#include "facade_params.h"

// 门框立柱对 (left has the smaller center X)
struct StudPair {
    BimElement left;
    BimElement right;
};

// Pairs studs into door openings; topology differs between source models
class StudPairingStrategy {
public:
    virtual ~StudPairingStrategy() {}

    virtual std::vector<StudPair> pairStuds(const std::vector<BimElement>& studs,
                                            FacadeReport& report) const = 0;
    virtual const char* name() const = 0;
};

// Sort by (center Z, center X), pair neighbours whose vertical centers are within tolerance
class SequentialStudPairing : public StudPairingStrategy {
public:
    explicit SequentialStudPairing(double sameFloorToleranceMm);

    std::vector<StudPair> pairStuds(const std::vector<BimElement>& studs,
                                    FacadeReport& report) const override;
    const char* name() const override { return "sequential"; }

private:
    double m_sameFloorToleranceMm;
};

// Exactly four studs: lower two and upper two, each row paired by X
class TwoRowStudPairing : public StudPairingStrategy {
public:
    std::vector<StudPair> pairStuds(const std::vector<BimElement>& studs,
                                    FacadeReport& report) const override;
    const char* name() const override { return "two_rows"; }
};

// 门构件分组: door-family members -> DoorOpening
class DoorComponentGrouper {
public:
    explicit DoorComponentGrouper(const FacadeParams& params = FacadeParams());

    // Throws InsufficientStudsError when members exist but fewer than two are studs
    std::vector<DoorOpening> group(const std::vector<BimElement>& doorElements,
                                   FacadeReport& report) const;

    // height > stud threshold -> stud, otherwise header
    void splitStudsHeaders(const std::vector<BimElement>& doorElements,
                           std::vector<BimElement>& studs,
                           std::vector<BimElement>& headers) const;

    // Greedy one-to-one assignment, pairs processed in order
    std::vector<DoorOpening> matchHeaders(const std::vector<StudPair>& pairs,
                                          const std::vector<BimElement>& headers,
                                          FacadeReport& report) const;

    const StudPairingStrategy& getPairingStrategy() const { return *m_pairing; }

private:
    std::vector<DoorOpening> groupUngrouped(const std::vector<BimElement>& doorElements) const;

    FacadeParams m_params;
    std::shared_ptr<StudPairingStrategy> m_pairing;
};
