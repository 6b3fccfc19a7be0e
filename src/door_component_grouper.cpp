#include "door_component_grouper.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

static bool lowerThenLeft(const BimElement& a, const BimElement& b) {
    if (a.centerZ() != b.centerZ()) {
        return a.centerZ() < b.centerZ();
    }
    return a.centerX() < b.centerX();
}

static bool leftOf(const BimElement& a, const BimElement& b) {
    return a.centerX() < b.centerX();
}

static StudPair makePair(const BimElement& a, const BimElement& b) {
    StudPair pair;
    if (leftOf(b, a)) {
        pair.left = b;
        pair.right = a;
    } else {
        pair.left = a;
        pair.right = b;
    }
    return pair;
}

SequentialStudPairing::SequentialStudPairing(double sameFloorToleranceMm)
    : m_sameFloorToleranceMm(sameFloorToleranceMm)
{
}

std::vector<StudPair> SequentialStudPairing::pairStuds(const std::vector<BimElement>& studs,
                                                       FacadeReport& report) const {
    std::vector<BimElement> sorted = studs;
    std::stable_sort(sorted.begin(), sorted.end(), lowerThenLeft);

    std::vector<StudPair> pairs;
    size_t i = 0;
    while (i + 1 < sorted.size()) {
        const BimElement& first = sorted[i];
        const BimElement& second = sorted[i + 1];

        if (std::abs(first.centerZ() - second.centerZ()) < m_sameFloorToleranceMm) {
            pairs.push_back(makePair(first, second));
            i += 2;
        } else {
            std::ostringstream msg;
            msg << "Stud " << first.id << " has no partner on the same floor, skipped";
            report.warn(msg.str());
            report.unpairedStuds++;
            i += 1;
        }
    }

    if (i < sorted.size()) {
        std::ostringstream msg;
        msg << "Stud " << sorted[i].id << " left unpaired, skipped";
        report.warn(msg.str());
        report.unpairedStuds++;
    }

    return pairs;
}

std::vector<StudPair> TwoRowStudPairing::pairStuds(const std::vector<BimElement>& studs,
                                                   FacadeReport& /*report*/) const {
    if (studs.size() != 4) {
        std::ostringstream msg;
        msg << "Two-row stud pairing expects exactly 4 studs, found " << studs.size();
        throw StudLayoutError(msg.str());
    }

    std::vector<BimElement> sorted = studs;
    std::stable_sort(sorted.begin(), sorted.end(), [](const BimElement& a, const BimElement& b) {
        return a.centerZ() < b.centerZ();
    });

    std::vector<StudPair> pairs;
    pairs.push_back(makePair(sorted[0], sorted[1]));   // lower row
    pairs.push_back(makePair(sorted[2], sorted[3]));   // upper row
    return pairs;
}

DoorComponentGrouper::DoorComponentGrouper(const FacadeParams& params)
    : m_params(params)
{
    if (m_params.studPairing == STUD_PAIR_TWO_ROWS) {
        m_pairing = std::make_shared<TwoRowStudPairing>();
    } else {
        m_pairing = std::make_shared<SequentialStudPairing>(m_params.sameFloorToleranceMm);
    }
}

std::vector<DoorOpening> DoorComponentGrouper::group(const std::vector<BimElement>& doorElements,
                                                     FacadeReport& report) const {
    if (m_params.doorGrouping == DOOR_GROUP_NONE) {
        return groupUngrouped(doorElements);
    }

    std::vector<BimElement> studs;
    std::vector<BimElement> headers;
    splitStudsHeaders(doorElements, studs, headers);

    if (studs.empty() && headers.empty()) {
        return std::vector<DoorOpening>();
    }

    if (studs.size() < 2) {
        std::ostringstream msg;
        msg << "Need at least 2 studs to form a door opening, found " << studs.size();
        throw InsufficientStudsError(msg.str());
    }

    if (headers.empty()) {
        report.warn("No headers found, door openings are built from studs only");
    }

    if (m_params.verbose) {
        std::cout << "  Found " << studs.size() << " studs, " << headers.size()
                  << " headers (" << m_pairing->name() << " pairing)" << std::endl;
    }

    std::vector<StudPair> pairs = m_pairing->pairStuds(studs, report);
    return matchHeaders(pairs, headers, report);
}

void DoorComponentGrouper::splitStudsHeaders(const std::vector<BimElement>& doorElements,
                                             std::vector<BimElement>& studs,
                                             std::vector<BimElement>& headers) const {
    studs.clear();
    headers.clear();

    for (const auto& element : doorElements) {
        if (!element.hasBox) continue;

        if (element.height() > m_params.studHeightThresholdMm) {
            studs.push_back(element);
        } else {
            headers.push_back(element);
        }
    }
}

std::vector<DoorOpening> DoorComponentGrouper::matchHeaders(const std::vector<StudPair>& pairs,
                                                            const std::vector<BimElement>& headers,
                                                            FacadeReport& report) const {
    std::vector<DoorOpening> openings;
    std::vector<bool> used(headers.size(), false);

    for (size_t p = 0; p < pairs.size(); ++p) {
        const StudPair& pair = pairs[p];
        double studTopZ = std::min(pair.left.maxBound.z(), pair.right.maxBound.z());

        int best = -1;
        double bestDiff = std::numeric_limits<double>::max();
        for (size_t h = 0; h < headers.size(); ++h) {
            if (used[h]) continue;
            double diff = std::abs(headers[h].centerZ() - studTopZ);
            if (diff < bestDiff) {
                bestDiff = diff;
                best = static_cast<int>(h);
            }
        }

        DoorOpening opening;
        opening.id = static_cast<int>(p) + 1;
        opening.studLeft = pair.left;
        opening.studRight = pair.right;
        opening.composite = true;
        opening.widthMm = std::abs(pair.right.centerX() - pair.left.centerX());

        double studBottomZ = std::min(pair.left.minBound.z(), pair.right.minBound.z());
        if (best >= 0) {
            used[best] = true;
            opening.header = headers[best];
            opening.heightMm = std::abs(headers[best].minBound.z() - studBottomZ);
        } else {
            std::ostringstream msg;
            msg << "No header left for door " << opening.id << " (studs "
                << pair.left.id << ", " << pair.right.id << ")";
            report.warn(msg.str());
            report.openingsWithoutHeader++;
            opening.heightMm = std::max(pair.left.height(), pair.right.height());
        }

        openings.push_back(opening);
    }

    return openings;
}

std::vector<DoorOpening> DoorComponentGrouper::groupUngrouped(const std::vector<BimElement>& doorElements) const {
    std::vector<DoorOpening> openings;

    for (const auto& element : doorElements) {
        if (!element.hasBox) continue;

        DoorOpening opening;
        opening.id = static_cast<int>(openings.size()) + 1;
        opening.studLeft = element;
        opening.studRight = element;
        opening.composite = false;
        opening.widthMm = element.width();
        opening.heightMm = element.height();
        openings.push_back(opening);
    }

    return openings;
}
