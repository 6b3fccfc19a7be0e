#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <Eigen/Dense>

// 立面方位: A=min-X, B=min-Y, C=max-X, D=max-Y
enum FacadeSide {
    SIDE_A = 0,
    SIDE_B = 1,
    SIDE_C = 2,
    SIDE_D = 3,
    SIDE_UNCLASSIFIED = 4,   // edge-tolerance mode only
    SIDE_INTERIOR = 5        // detection batch not attributable to any exterior side
};

const int FACADE_SIDE_COUNT = 4;
const FacadeSide FACADE_SIDES[FACADE_SIDE_COUNT] = { SIDE_A, SIDE_B, SIDE_C, SIDE_D };

enum FloorLevel {
    FLOOR_UNKNOWN = 0,
    FLOOR_1 = 1,
    FLOOR_2 = 2
};

enum ElementKind {
    KIND_PANEL = 0,
    KIND_DOOR = 1,
    KIND_WINDOW = 2
};

std::string sideToString(FacadeSide side);
std::string floorToString(FloorLevel floor);
std::string kindToString(ElementKind kind);

// Detector label -> element kind ("window"/"windows", "wall_panels"/"wall-panels"/...)
bool labelToKind(const std::string& label, ElementKind& kind);

// BIM构件: 轴对齐包围盒 (mm)
struct BimElement {
    long id;
    bool hasBox;                   // false when the host model returned no bounding box
    Eigen::Vector3d minBound;
    Eigen::Vector3d maxBound;

    BimElement() : id(0), hasBox(false), minBound(Eigen::Vector3d::Zero()), maxBound(Eigen::Vector3d::Zero()) {}
    BimElement(long id_, double xmin, double xmax, double ymin, double ymax, double zmin, double zmax)
        : id(id_), hasBox(true), minBound(xmin, ymin, zmin), maxBound(xmax, ymax, zmax) {}

    double width() const { return maxBound.x() - minBound.x(); }
    double depth() const { return maxBound.y() - minBound.y(); }
    double height() const { return maxBound.z() - minBound.z(); }
    double centerX() const { return (minBound.x() + maxBound.x()) / 2.0; }
    double centerY() const { return (minBound.y() + maxBound.y()) / 2.0; }
    double centerZ() const { return (minBound.z() + maxBound.z()) / 2.0; }
};

// Everything the host-collection collaborator hands over for one run
struct FacadeElements {
    std::vector<BimElement> panels;
    std::vector<BimElement> doors;       // door-family framing members
    std::vector<BimElement> windows;
};

// 建筑外轮廓 (plan view)
struct FacadeBounds {
    double xmin, xmax;
    double ymin, ymax;

    FacadeBounds() : xmin(0), xmax(0), ymin(0), ymax(0) {}
    FacadeBounds(double xmin_, double xmax_, double ymin_, double ymax_)
        : xmin(xmin_), xmax(xmax_), ymin(ymin_), ymax(ymax_) {}
};

// 门洞: two studs and, when one could be matched, a header
struct DoorOpening {
    int id;                             // 1-based, in pairing order
    BimElement studLeft;
    BimElement studRight;
    std::optional<BimElement> header;
    bool composite;                     // false: a single ungrouped door element (left == right)
    double widthMm;
    double heightMm;

    DoorOpening() : id(0), composite(true), widthMm(0), heightMm(0) {}

    bool hasHeader() const { return header.has_value(); }
    double centerX() const { return (studLeft.centerX() + studRight.centerX()) / 2.0; }
    double centerY() const { return (studLeft.centerY() + studRight.centerY()) / 2.0; }

    // Members that make up the opening (one for ungrouped, two or three otherwise)
    std::vector<const BimElement*> members() const;

    double xmin() const;
    double xmax() const;
};

// 图像检测结果 (normalized image coordinates)
struct Detection {
    std::string id;
    bool numericId;                     // echo the id back as a JSON number
    std::string label;
    FloorLevel floor;
    double xNorm;
    std::optional<double> yNorm;

    Detection() : numericId(false), floor(FLOOR_UNKNOWN), xNorm(0) {}
};

// Element placed on a side with its side-local position
struct NormalizedElement {
    ElementKind kind;
    long id;
    FacadeSide side;
    FloorLevel floor;
    double xmin;
    double xmax;
    double position;                    // ((xmin+xmax)/2 - side_min) / side_width, not clamped
    int tag;                            // 1..N within the side, position order

    NormalizedElement() : kind(KIND_PANEL), id(0), side(SIDE_A), floor(FLOOR_UNKNOWN),
                          xmin(0), xmax(0), position(0), tag(0) {}
};

struct MatchRecord {
    std::string detectionId;
    bool numericId;
    std::string label;
    std::optional<long> elementId;
    std::optional<int> elementTag;
    std::optional<double> distance;
    std::string note;                   // reason when unmatched

    MatchRecord() : numericId(false) {}

    bool isMatched() const { return elementId.has_value(); }
};

// Recoverable problems collected during one run
struct FacadeReport {
    std::vector<std::string> warnings;
    int skippedElements;
    int unpairedStuds;
    int openingsWithoutHeader;
    int unclassifiedElements;
    int unmatchedDetections;

    FacadeReport() : skippedElements(0), unpairedStuds(0), openingsWithoutHeader(0),
                     unclassifiedElements(0), unmatchedDetections(0) {}

    void warn(const std::string& message) { warnings.push_back(message); }
};

// 致命错误
class FacadeError : public std::runtime_error {
public:
    explicit FacadeError(const std::string& message) : std::runtime_error(message) {}
};

class NoGeometryError : public FacadeError {
public:
    explicit NoGeometryError(const std::string& message) : FacadeError(message) {}
};

class InsufficientDataError : public FacadeError {
public:
    explicit InsufficientDataError(const std::string& message) : FacadeError(message) {}
};

class InsufficientStudsError : public FacadeError {
public:
    explicit InsufficientStudsError(const std::string& message) : FacadeError(message) {}
};

// Stud count does not fit the configured pairing topology
class StudLayoutError : public FacadeError {
public:
    explicit StudLayoutError(const std::string& message) : FacadeError(message) {}
};
