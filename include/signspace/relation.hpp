#pragma once

#include "signspace/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace signspace {

enum class RelationKind : uint8_t {
    Unknown = 0,
    // generated layouts
    Hierarchy = 1,
    Alignment = 2,
    Containment = 3,
    // extracted analyses
    Temporal = 4,
    Spatial = 5,
    Semantic = 6,
    Causal = 7,
    Structural = 8
};

const char* relation_kind_name(RelationKind kind) noexcept;

// Unknown labels map to Semantic
RelationKind parse_relation_kind(std::string_view label) noexcept;

struct HierarchyDetail {
    std::string relation_name = "subject-object";
};

struct AlignmentDetail {
    std::string temporal_alignment = "present";
};

struct ContainmentDetail {
    std::string relation_name = "container-contained";
};

struct SequenceDetail {
    size_t index = 0;
};

using RelationDetail = std::variant<std::monostate, HierarchyDetail, AlignmentDetail,
                                    ContainmentDetail, SequenceDetail>;

/**
 * Directed relation between two elements or components.
 * Immutable once built; corrections create a replacement relation.
 */
struct SpatialRelation {
    std::string id;
    RelationKind kind = RelationKind::Unknown;
    std::string source_id;
    std::string target_id;
    double strength = 0.7;      // [0,1]
    RelationDetail detail;
    Extensions extensions;
};

} // namespace signspace
