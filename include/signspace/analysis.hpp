#pragma once

#include "signspace/relation.hpp"
#include "signspace/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace signspace {

enum class ComponentKind : uint8_t {
    Unknown = 0,
    Zone = 1,
    Proforme = 2,
    Pointing = 3,
    Transition = 4,
    Gaze = 5,
    Expression = 6,
    Orientation = 7,
    Movement = 8
};

constexpr size_t COMPONENT_KIND_COUNT = 8;   // excluding Unknown

const char* component_kind_name(ComponentKind kind) noexcept;

// Unknown labels map to Zone
ComponentKind parse_component_kind(std::string_view label) noexcept;

struct SpatialComponent {
    std::string id;
    ComponentKind kind = ComponentKind::Unknown;
    Point3D position = Point3D::Zero();
    std::map<std::string, std::string> properties;
};

struct SpatialGraph {
    std::vector<SpatialComponent> nodes;
    std::vector<SpatialRelation> edges;
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;       // edges / (n * (n - 1))
};

struct AnalysisStatistics {
    size_t component_count = 0;
    size_t relation_count = 0;
    double complexity_score = 0.0;
    double coherence_score = 0.0;
};

struct AnalysisMetadata {
    double processing_time_ms = 0.0;
    double confidence_score = 0.0;
    std::string model_version;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
    AnalysisStatistics statistics;
};

struct SpatialAnalysis {
    std::string id;
    std::vector<SpatialComponent> components;
    std::vector<SpatialRelation> relations;
    SpatialGraph graph;
    AnalysisMetadata metadata;
};

// =============================================================================
// Analyzer input
// =============================================================================

using FieldValue = std::variant<std::string, double, bool>;
using FieldMap = std::map<std::string, FieldValue>;

/**
 * One structured component or relation record. Position may arrive as a
 * nested `position` map or as flat x/y/z fields.
 */
struct InputRecord {
    FieldMap fields;
    std::optional<FieldMap> position;

    std::optional<std::string> text(const std::string& key) const;
    std::optional<double> number(const std::string& key) const;
};

struct StructuredInput {
    std::vector<InputRecord> components;
    std::vector<InputRecord> relations;
};

struct AnalyzerInput {
    std::string type = "text";
    std::variant<std::string, StructuredInput> data;
    std::optional<CulturalContext> context;

    static AnalyzerInput from_text(std::string text);
    static AnalyzerInput from_records(StructuredInput records);
};

std::string field_to_string(const FieldValue& value);

} // namespace signspace
