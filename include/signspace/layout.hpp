#pragma once

#include "signspace/relation.hpp"
#include "signspace/types.hpp"
#include "signspace/zone.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace signspace {

enum class EntityKind : uint8_t {
    Entity = 0,
    Landmark = 1,
    Container = 2,
    Concept = 3
};

const char* entity_kind_name(EntityKind kind) noexcept;

struct ActantProperties {
    std::string role = "generic";
};

struct TimeMarkerProperties {
    std::string time_segment;
};

struct TopicMarkerProperties {
    std::string thematic_field = "general";
    std::string emphasis = "standard";
};

struct ContainerProperties {
    std::string container_type = "generic";
};

struct ConceptProperties {
    std::string concept_type = "abstract";
};

using ElementProperties = std::variant<ActantProperties, TimeMarkerProperties, TopicMarkerProperties,
                                       ContainerProperties, ConceptProperties>;

struct Dimensions3D {
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;
};

struct SpatialElement {
    static constexpr double DEFAULT_IMPORTANCE = 0.5;
    static constexpr double DEFAULT_RADIUS = 0.1;

    std::string id;
    EntityKind kind = EntityKind::Entity;
    Point3D position = Point3D::Zero();
    std::optional<Dimensions3D> dimensions;
    std::optional<double> importance;
    ElementProperties properties = ActantProperties{};
    std::string zone_id;
    std::optional<std::string> proforme_id;
    Extensions extensions;

    double importance_or_default() const noexcept {
        return importance.value_or(DEFAULT_IMPORTANCE);
    }

    // Half the largest dimension, or a fixed radius for point-like elements
    double radius() const noexcept;

    const TimeMarkerProperties* time_marker() const noexcept {
        return std::get_if<TimeMarkerProperties>(&properties);
    }
};

/**
 * Zones, elements keyed by id, and the relations between elements.
 */
struct SpatialLayout {
    std::vector<ReferenceZone> zones;
    std::map<std::string, SpatialElement> elements;
    std::vector<SpatialRelation> relations;
    std::optional<CulturalContext> context;
    // Proforme ids active in the registry when the layout was generated
    std::optional<std::set<std::string>> active_proformes;

    const ReferenceZone* find_zone(const std::string& id) const;
    bool has_element(const std::string& id) const { return elements.count(id) != 0; }
};

} // namespace signspace
