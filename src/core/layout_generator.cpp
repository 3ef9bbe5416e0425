#include "signspace/layout_generator.hpp"
#include "signspace/error.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace signspace {

namespace {

constexpr double COINCIDENT_ELEMENT_EPSILON = 1e-3;
constexpr double PI = 3.14159265358979323846;

Dimensions3D scaled_dimensions(const Area3D& area, double factor) {
    return Dimensions3D{area.width * factor, area.height * factor, area.depth * factor};
}

SpatialRelation make_relation(const SpatialElement& source, const SpatialElement& target,
                              RelationKind kind, double strength, RelationDetail detail) {
    SpatialRelation relation;
    relation.id = "relation-" + source.id + "-" + target.id;
    relation.kind = kind;
    relation.source_id = source.id;
    relation.target_id = target.id;
    relation.strength = clamp_unit(strength);
    relation.detail = std::move(detail);
    return relation;
}

} // anonymous namespace

SpatialLayout LayoutGenerator::generate_layout(const std::vector<ReferenceZone>& zones,
                                               const CulturalContext* context) const {
    if (zones.empty()) {
        throw LayoutError("Cannot generate a layout without zones", ErrorCode::LAYOUT_EMPTY, __func__);
    }

    SpatialLayout layout;
    layout.zones = zones;
    if (context) layout.context = *context;

    std::set<std::string> active;
    for (const auto& proforme : proformes_.active_proformes()) {
        active.insert(proforme.id);
    }
    layout.active_proformes = std::move(active);

    place_elements(layout);
    create_relations(layout);
    optimize_element_positions(layout);

    if (!validate_layout(layout)) {
        throw LayoutError("Invalid spatial layout generated (" + std::to_string(layout.elements.size()) +
                          " elements, " + std::to_string(layout.relations.size()) + " relations)",
                          ErrorCode::LAYOUT_INVALID, __func__);
    }

    for (const auto& [id, element] : layout.elements) {
        if (!space_.contains_point(element.position)) {
            LOG_DEBUG("Element '", id, "' lies outside the signing space bounds");
        }
    }

    LOG_DEBUG("Layout generated: ", layout.elements.size(), " elements, ",
              layout.relations.size(), " relations");
    return layout;
}

// =============================================================================
// Element placement
// =============================================================================

void LayoutGenerator::place_elements(SpatialLayout& layout) const {
    for (const auto& zone : layout.zones) {
        switch (zone.kind) {
            case ZoneKind::Actant:    place_actant(zone, layout); break;
            case ZoneKind::Timeline:  place_time_markers(zone, layout); break;
            case ZoneKind::Topic:     place_topic_marker(zone, layout); break;
            case ZoneKind::Container: place_container(zone, layout); break;
            case ZoneKind::Abstract:  place_abstract_concept(zone, layout); break;
            case ZoneKind::Neutral:   break;   // no elements
        }
    }
}

std::optional<std::string> LayoutGenerator::proforme_for(const char* concept_name, const char* fallback) const {
    for (const char* name : {concept_name, fallback}) {
        auto matches = proformes_.proformes_by_representation(name);
        if (!matches.empty()) return matches.front().id;
    }
    return std::nullopt;
}

void LayoutGenerator::place_actant(const ReferenceZone& zone, SpatialLayout& layout) const {
    SpatialElement element;
    element.id = "actant-" + zone.id;
    element.kind = EntityKind::Entity;
    element.position = zone.area.center;
    element.dimensions = scaled_dimensions(zone.area, 0.8);
    element.importance = zone.significance;

    ActantProperties properties;
    if (const auto* meta = zone.metadata_as<ActantMetadata>()) {
        properties.role = meta->default_role;
    }
    element.properties = properties;
    element.zone_id = zone.id;
    element.proforme_id = proforme_for("person", "pointing-reference");

    layout.elements[element.id] = std::move(element);
}

void LayoutGenerator::place_time_markers(const ReferenceZone& zone, SpatialLayout& layout) const {
    std::vector<std::string> segments{"past", "present", "future"};
    if (const auto* meta = zone.metadata_as<TimelineMetadata>(); meta && !meta->segments.empty()) {
        segments = meta->segments;
    }

    // Evenly spaced along the zone width, centered on the zone
    const double segment_width = zone.area.width / static_cast<double>(segments.size());
    const double middle = (static_cast<double>(segments.size()) - 1.0) / 2.0;

    for (size_t i = 0; i < segments.size(); ++i) {
        SpatialElement marker;
        marker.id = "time-" + zone.id + "-" + segments[i];
        marker.kind = EntityKind::Landmark;
        marker.position = zone.area.center;
        marker.position.x() += (static_cast<double>(i) - middle) * segment_width;
        marker.importance = segments[i] == "present" ? 0.9 : 0.7;
        marker.properties = TimeMarkerProperties{segments[i]};
        marker.zone_id = zone.id;

        layout.elements[marker.id] = std::move(marker);
    }
}

void LayoutGenerator::place_topic_marker(const ReferenceZone& zone, SpatialLayout& layout) const {
    SpatialElement marker;
    marker.id = "topic-" + zone.id;
    marker.kind = EntityKind::Landmark;
    marker.position = zone.area.center;

    TopicMarkerProperties properties;
    if (const auto* meta = zone.metadata_as<TopicMetadata>()) {
        properties.thematic_field = meta->thematic_field;
        properties.emphasis = meta->emphasis;
    }
    marker.properties = properties;
    marker.zone_id = zone.id;

    layout.elements[marker.id] = std::move(marker);
}

void LayoutGenerator::place_container(const ReferenceZone& zone, SpatialLayout& layout) const {
    SpatialElement element;
    element.id = "container-" + zone.id;
    element.kind = EntityKind::Container;
    element.position = zone.area.center;
    element.dimensions = scaled_dimensions(zone.area, 0.9);
    element.importance = zone.significance;

    ContainerProperties properties;
    if (const auto* meta = zone.metadata_as<ContainerMetadata>()) {
        properties.container_type = meta->container_type;
    }
    element.properties = properties;
    element.zone_id = zone.id;
    element.proforme_id = proforme_for("cylindrical-object", "surface");

    layout.elements[element.id] = std::move(element);
}

void LayoutGenerator::place_abstract_concept(const ReferenceZone& zone, SpatialLayout& layout) const {
    SpatialElement element;
    element.id = "abstract-" + zone.id;
    element.kind = EntityKind::Concept;
    element.position = zone.area.center;
    element.importance = zone.significance;

    ConceptProperties properties;
    if (const auto* meta = zone.metadata_as<AbstractMetadata>()) {
        properties.concept_type = meta->concept_type;
    }
    element.properties = properties;
    element.zone_id = zone.id;

    layout.elements[element.id] = std::move(element);
}

// =============================================================================
// Relations
// =============================================================================

void LayoutGenerator::create_relations(SpatialLayout& layout) const {
    std::vector<const SpatialElement*> entities;
    std::vector<const SpatialElement*> time_markers;
    std::vector<const SpatialElement*> containers;
    std::vector<const SpatialElement*> others;

    for (const auto& [id, element] : layout.elements) {
        if (element.kind == EntityKind::Entity) entities.push_back(&element);
        if (element.time_marker()) time_markers.push_back(&element);
        if (element.kind == EntityKind::Container) {
            containers.push_back(&element);
        } else {
            others.push_back(&element);
        }
    }

    for (size_t i = 0; i + 1 < entities.size(); ++i) {
        for (size_t j = i + 1; j < entities.size(); ++j) {
            layout.relations.push_back(make_relation(*entities[i], *entities[j], RelationKind::Hierarchy,
                                                     0.8, HierarchyDetail{}));
        }
    }

    for (const auto* marker : time_markers) {
        const std::string& segment = marker->time_marker()->time_segment;
        for (const auto* entity : entities) {
            layout.relations.push_back(make_relation(*marker, *entity, RelationKind::Alignment, 0.7,
                                                     AlignmentDetail{segment.empty() ? "present" : segment}));
        }
    }

    for (const auto* container : containers) {
        for (const auto* element : others) {
            if (is_element_in_container(*element, *container)) {
                layout.relations.push_back(make_relation(*container, *element, RelationKind::Containment,
                                                         0.9, ContainmentDetail{}));
            }
        }
    }
}

bool LayoutGenerator::is_element_in_container(const SpatialElement& element,
                                              const SpatialElement& container) noexcept {
    if (!container.dimensions) return false;

    const Vector3D offset = (element.position - container.position).cwiseAbs();
    return offset.x() < container.dimensions->width / 2.0 &&
           offset.y() < container.dimensions->height / 2.0 &&
           offset.z() < container.dimensions->depth / 2.0;
}

// =============================================================================
// Position optimization
// =============================================================================

void LayoutGenerator::optimize_element_positions(SpatialLayout& layout) const {
    std::map<std::string, std::vector<SpatialElement*>> by_zone;
    std::vector<SpatialElement*> all;
    all.reserve(layout.elements.size());

    for (auto& [id, element] : layout.elements) {
        all.push_back(&element);
        if (!element.zone_id.empty()) {
            by_zone[element.zone_id].push_back(&element);
        }
    }

    for (auto& [zone_id, members] : by_zone) {
        if (members.size() < 2) continue;
        if (const ReferenceZone* zone = layout.find_zone(zone_id)) {
            distribute_elements(members, zone->area.center);
        }
    }

    const int passes = resolve_element_overlaps(all);
    LOG_DEBUG("Element overlap resolution ran ", passes, " pass(es)");

    optimize_element_visibility(all);
}

void LayoutGenerator::distribute_elements(std::vector<SpatialElement*>& elements, const Point3D& center) const {
    if (elements.size() <= 1) return;

    const double step = 2.0 * PI / static_cast<double>(elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        const double angle = static_cast<double>(i) * step;
        elements[i]->position = Point3D(center.x() + DISTRIBUTION_RADIUS * std::cos(angle),
                                        center.y(),
                                        center.z() + DISTRIBUTION_RADIUS * std::sin(angle));
    }
}

bool LayoutGenerator::elements_overlap(const SpatialElement& a, const SpatialElement& b) noexcept {
    const double distance = (a.position - b.position).norm();
    return distance < a.radius() + b.radius();
}

void LayoutGenerator::resolve_overlap(SpatialElement& a, SpatialElement& b) noexcept {
    const Vector3D offset = b.position - a.position;
    const double distance = offset.norm();

    if (distance < COINCIDENT_ELEMENT_EPSILON) {
        b.position.x() += 0.1;
        b.position.z() += 0.1;
        return;
    }

    const Vector3D direction = offset / distance;
    const double min_distance = (a.radius() + b.radius()) * OVERLAP_MARGIN;
    const double move = min_distance - distance;
    if (move <= 0.0) return;

    const double importance_a = a.importance_or_default();
    const double importance_b = b.importance_or_default();
    const double total = importance_a + importance_b;

    // Each side moves in proportion to the other's importance
    const double share_a = total > 0.0 ? importance_b / total : 0.5;
    const double share_b = total > 0.0 ? importance_a / total : 0.5;

    a.position -= direction * (move * share_a);
    b.position += direction * (move * share_b);
}

int LayoutGenerator::resolve_element_overlaps(std::vector<SpatialElement*>& elements) noexcept {
    int passes = 0;
    for (int iter = 0; iter < MAX_OVERLAP_ITERATIONS; ++iter) {
        ++passes;
        bool resolved = true;
        for (size_t i = 0; i < elements.size(); ++i) {
            for (size_t j = i + 1; j < elements.size(); ++j) {
                if (elements_overlap(*elements[i], *elements[j])) {
                    resolve_overlap(*elements[i], *elements[j]);
                    resolved = false;
                }
            }
        }
        if (resolved) break;
    }
    return passes;
}

void LayoutGenerator::optimize_element_visibility(std::vector<SpatialElement*>& elements) const {
    std::vector<SpatialElement*> ranked = elements;
    std::stable_sort(ranked.begin(), ranked.end(), [](const SpatialElement* a, const SpatialElement* b) {
        return a->importance_or_default() > b->importance_or_default();
    });

    const size_t count = std::min(ranked.size(), SALIENT_ELEMENT_COUNT);
    for (size_t i = 0; i < count; ++i) {
        ranked[i]->position.z() *= SALIENCE_DEPTH_FACTOR;
        ranked[i]->position.y() += SALIENCE_LIFT;
    }
}

// =============================================================================
// Validation
// =============================================================================

bool LayoutGenerator::validate_layout(const SpatialLayout& layout) const {
    if (layout.zones.empty() || layout.elements.empty()) return false;

    for (const auto& [id, element] : layout.elements) {
        if (!element.zone_id.empty() && !layout.find_zone(element.zone_id)) {
            LOG_WARN("Element '", id, "' references unknown zone '", element.zone_id, "'");
            return false;
        }
    }

    for (const auto& relation : layout.relations) {
        if (!layout.has_element(relation.source_id) || !layout.has_element(relation.target_id)) {
            LOG_WARN("Relation '", relation.id, "' has a dangling endpoint");
            return false;
        }
    }

    return true;
}

} // namespace signspace
