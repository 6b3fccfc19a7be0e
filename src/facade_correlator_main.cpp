#include "facade_correlator.h"
#include "facade_json_io.h"
#include <iostream>
#include <string>
#include <stdexcept>

void printUsage() {
    std::cout << "Facade correlation tool usage:" << std::endl;
    std::cout << "facade_correlator <elements.json> <detections.json> <output_dir> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <params.json>          Load parameters (overridden by later options)" << std::endl;
    std::cout << "  --bounds <extents|midpoints>    Footprint sample strategy" << std::endl;
    std::cout << "  --floor-stat <bottom|center>    Per-element Z statistic for floors" << std::endl;
    std::cout << "  --edge-tolerance <mm>           Leave elements farther than <mm> from every edge unclassified" << std::endl;
    std::cout << "  --stud-height <mm>              Door members taller than this are studs" << std::endl;
    std::cout << "  --floor-tolerance <mm>          Stud pairing vertical tolerance" << std::endl;
    std::cout << "  --pairing <sequential|two_rows> Stud pairing strategy" << std::endl;
    std::cout << "  --panel-grouping <none|components> Merge the panels of one side and floor" << std::endl;
    std::cout << "  --no-door-grouping              Treat every door element as its own opening" << std::endl;
    std::cout << "  --no-window-floors              Put every window on floor 1" << std::endl;
    std::cout << "  --interior-threshold <score>    Minimum side score for an exterior side" << std::endl;
    std::cout << "  --report <file>                 Write a text report" << std::endl;
    std::cout << "  --verbose                       Print stage details" << std::endl;
    std::cout << "  --help                          Show this help information" << std::endl;
}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--help") {
            printUsage();
            return 0;
        }
    }

    // Check arguments
    if (argc < 4) {
        std::cerr << "Insufficient arguments" << std::endl;
        printUsage();
        return 1;
    }

    std::string elementsFile = argv[1];
    std::string detectionsFile = argv[2];
    std::string outputDir = argv[3];
    std::string reportFile;

    FacadeParams params;

    // Parse options
    try {
        for (int i = 4; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--config" && i + 1 < argc) {
                if (!loadParamsJson(argv[i + 1], params)) {
                    std::cerr << "Failed to load configuration" << std::endl;
                    return 1;
                }
                i += 1;
            } else if (arg == "--bounds" && i + 1 < argc) {
                if (!parseBoundsStrategy(argv[i + 1], params.boundsStrategy)) {
                    std::cerr << "Unknown bounds strategy: " << argv[i + 1] << std::endl;
                    return 1;
                }
                i += 1;
            } else if (arg == "--floor-stat" && i + 1 < argc) {
                if (!parseFloorStatistic(argv[i + 1], params.floorStatistic)) {
                    std::cerr << "Unknown floor statistic: " << argv[i + 1] << std::endl;
                    return 1;
                }
                i += 1;
            } else if (arg == "--edge-tolerance" && i + 1 < argc) {
                params.sideMode = SIDE_EDGE_TOLERANCE;
                params.edgeToleranceMm = std::stod(argv[i + 1]);
                i += 1;
            } else if (arg == "--stud-height" && i + 1 < argc) {
                params.studHeightThresholdMm = std::stod(argv[i + 1]);
                i += 1;
            } else if (arg == "--floor-tolerance" && i + 1 < argc) {
                params.sameFloorToleranceMm = std::stod(argv[i + 1]);
                i += 1;
            } else if (arg == "--pairing" && i + 1 < argc) {
                if (!parseStudPairing(argv[i + 1], params.studPairing)) {
                    std::cerr << "Unknown stud pairing: " << argv[i + 1] << std::endl;
                    return 1;
                }
                i += 1;
            } else if (arg == "--panel-grouping" && i + 1 < argc) {
                if (!parsePanelGrouping(argv[i + 1], params.panelGrouping)) {
                    std::cerr << "Unknown panel grouping: " << argv[i + 1] << std::endl;
                    return 1;
                }
                i += 1;
            } else if (arg == "--no-door-grouping") {
                params.doorGrouping = DOOR_GROUP_NONE;
            } else if (arg == "--no-window-floors") {
                params.classifyWindowFloors = false;
            } else if (arg == "--interior-threshold" && i + 1 < argc) {
                params.interiorThreshold = std::stod(argv[i + 1]);
                i += 1;
            } else if (arg == "--report" && i + 1 < argc) {
                reportFile = argv[i + 1];
                i += 1;
            } else if (arg == "--verbose") {
                params.verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage();
                return 1;
            }
        }
    } catch (const std::invalid_argument&) {
        std::cerr << "Invalid numeric option value" << std::endl;
        printUsage();
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Numeric option value out of range" << std::endl;
        return 1;
    }

    FacadeCorrelator correlator;

    if (!correlator.loadElements(elementsFile)) {
        std::cerr << "Failed to load BIM elements" << std::endl;
        return 1;
    }
    if (!correlator.loadDetections(detectionsFile)) {
        std::cerr << "Failed to load detections" << std::endl;
        return 1;
    }

    if (!correlator.correlate(params)) {
        std::cerr << "Facade correlation failed: " << correlator.getLastError() << std::endl;
        return 1;
    }

    if (!params.verbose) {
        correlator.printSideScoreTable();
    }
    correlator.printCorrelationReport();

    if (!correlator.exportJson(outputDir)) {
        std::cerr << "Failed to export JSON results" << std::endl;
        return 1;
    }

    if (!reportFile.empty() && !correlator.exportToReport(reportFile)) {
        std::cerr << "Failed to write report" << std::endl;
        return 1;
    }

    std::cout << "Facade correlation complete" << std::endl;
    return 0;
}
