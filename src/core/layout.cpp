#include "signspace/layout.hpp"
#include "signspace/relation.hpp"
#include "signspace/zone.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace signspace {

const char* zone_kind_name(ZoneKind kind) noexcept {
    switch (kind) {
        case ZoneKind::Timeline:  return "timeline";
        case ZoneKind::Actant:    return "actant";
        case ZoneKind::Topic:     return "topic";
        case ZoneKind::Neutral:   return "neutral";
        case ZoneKind::Abstract:  return "abstract";
        case ZoneKind::Container: return "container";
    }
    return "unknown";
}

const char* entity_kind_name(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Entity:    return "entity";
        case EntityKind::Landmark:  return "landmark";
        case EntityKind::Container: return "container";
        case EntityKind::Concept:   return "concept";
    }
    return "unknown";
}

const char* relation_kind_name(RelationKind kind) noexcept {
    switch (kind) {
        case RelationKind::Unknown:     return "unknown";
        case RelationKind::Hierarchy:   return "hierarchy";
        case RelationKind::Alignment:   return "alignment";
        case RelationKind::Containment: return "containment";
        case RelationKind::Temporal:    return "temporal";
        case RelationKind::Spatial:     return "spatial";
        case RelationKind::Semantic:    return "semantic";
        case RelationKind::Causal:      return "causal";
        case RelationKind::Structural:  return "structural";
    }
    return "unknown";
}

RelationKind parse_relation_kind(std::string_view label) noexcept {
    std::string lower(label);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto kind : {RelationKind::Hierarchy, RelationKind::Alignment, RelationKind::Containment,
                      RelationKind::Temporal, RelationKind::Spatial, RelationKind::Semantic,
                      RelationKind::Causal, RelationKind::Structural}) {
        if (lower == relation_kind_name(kind)) return kind;
    }
    return RelationKind::Semantic;
}

double SpatialElement::radius() const noexcept {
    if (!dimensions) return DEFAULT_RADIUS;
    return std::max({dimensions->width, dimensions->height, dimensions->depth}) * 0.5;
}

const ReferenceZone* SpatialLayout::find_zone(const std::string& id) const {
    auto it = std::find_if(zones.begin(), zones.end(),
                           [&](const ReferenceZone& z) { return z.id == id; });
    return it != zones.end() ? &*it : nullptr;
}

} // namespace signspace
