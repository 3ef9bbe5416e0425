#include "signspace/zone_generator.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace signspace {

namespace {

ReferenceZone make_zone(const std::string& id, const std::string& name, ZoneKind kind,
                        const Point3D& center, double width, double height, double depth,
                        double significance, int priority, ZoneMetadata metadata) {
    ReferenceZone zone;
    zone.id = id;
    zone.name = name;
    zone.kind = kind;
    zone.area = Area3D{center, width, height, depth};
    zone.significance = clamp_unit(significance);
    zone.priority = priority;
    zone.metadata = std::move(metadata);
    return zone;
}

} // anonymous namespace

double actant_zone_size(double formality) noexcept {
    return 0.4 + (clamp_unit(formality) - 0.5) * 0.1;
}

// =============================================================================
// Generation
// =============================================================================

std::vector<ReferenceZone> ReferenceZoneGenerator::generate_zones(const CulturalContext& context) {
    std::vector<ReferenceZone> zones;
    for (auto kind : {ZoneKind::Timeline, ZoneKind::Actant, ZoneKind::Topic,
                      ZoneKind::Neutral, ZoneKind::Abstract, ZoneKind::Container}) {
        auto batch = generate_zones_by_type(context, kind);
        zones.insert(zones.end(), batch.begin(), batch.end());
    }

    std::vector<ReferenceZone> optimized = optimize_zone_layout(zones);

    for (const auto& zone : optimized) {
        space_.remove_zone(zone.id);
        space_.add_zone(zone);
    }

    LOG_DEBUG("Generated ", optimized.size(), " zones for region '", context.region,
              "' (", context.tag_label(), ")");
    return optimized;
}

std::vector<ReferenceZone> ReferenceZoneGenerator::generate_zones_by_type(const CulturalContext& context,
                                                                          ZoneKind kind) const {
    switch (kind) {
        case ZoneKind::Timeline:  return create_timeline_zones(context);
        case ZoneKind::Actant:    return create_actant_zones(context);
        case ZoneKind::Topic:     return create_topic_zones(context);
        case ZoneKind::Neutral:   return create_neutral_zones(context);
        case ZoneKind::Abstract:  return create_abstract_zones(context);
        case ZoneKind::Container: return create_container_zones(context);
    }
    return {};
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_timeline_zones(const CulturalContext& context) const {
    TimelineMetadata metadata;
    metadata.direction = context.region == "france" ? "left-to-right" : "context-dependent";

    return {make_zone("timeline-main", "Main Timeline", ZoneKind::Timeline,
                      Point3D(0.0, 0.0, 0.5), 1.5, 0.2, 0.2, 0.9, 1, std::move(metadata))};
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_actant_zones(const CulturalContext& context) const {
    const double side = actant_zone_size(context.formality());
    const std::string usage = context.tag_label();

    return {
        make_zone("actant-left", "Left Actant", ZoneKind::Actant, Point3D(-0.7, 0.0, 0.3),
                  side, side, side, 0.8, 2, ActantMetadata{"subject", usage}),
        make_zone("actant-right", "Right Actant", ZoneKind::Actant, Point3D(0.7, 0.0, 0.3),
                  side, side, side, 0.8, 2, ActantMetadata{"object", usage}),
    };
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_topic_zones(const CulturalContext& context) const {
    TopicMetadata metadata;
    metadata.thematic_field = context.parameter_or("thematicField", "general");
    metadata.emphasis = context.formality() > 0.7 ? "formal" : "standard";

    return {make_zone("topic-main", "Main Topic", ZoneKind::Topic, Point3D(0.0, 0.3, 0.3),
                      0.5, 0.5, 0.3, 0.75, 3, std::move(metadata))};
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_neutral_zones(const CulturalContext&) const {
    return {make_zone("neutral-center", "Neutral Center", ZoneKind::Neutral, Point3D::Zero(),
                      0.5, 0.5, 0.5, 0.8, 2, NeutralMetadata{})};
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_abstract_zones(const CulturalContext& context) const {
    if (context.tag != ContextTag::Custom || context.custom_tag != "abstract-reasoning") {
        return {};
    }
    return {make_zone("abstract-concepts", "Abstract Concepts", ZoneKind::Abstract,
                      Point3D(0.0, 0.5, 0.5), 0.6, 0.6, 0.6, 0.7, 4, AbstractMetadata{"abstract"})};
}

std::vector<ReferenceZone> ReferenceZoneGenerator::create_container_zones(const CulturalContext& context) const {
    if (!context.parameter_flag("hasContainers")) {
        return {};
    }
    ContainerMetadata metadata{context.parameter_or("containerType", "generic")};
    return {make_zone("container-main", "Main Container", ZoneKind::Container,
                      Point3D(0.0, 0.2, 0.7), 0.8, 0.6, 0.6, 0.6, 5, std::move(metadata))};
}

// =============================================================================
// Overlap resolution
// =============================================================================

bool ReferenceZoneGenerator::zones_overlap(const ReferenceZone& a, const ReferenceZone& b) noexcept {
    return volumes_overlap(a.area, b.area);
}

void ReferenceZoneGenerator::separate_from(ReferenceZone& zone, const ReferenceZone& reference) noexcept {
    const Vector3D offset = zone.area.center - reference.area.center;
    const double length = offset.norm();

    if (length < COINCIDENT_EPSILON) {
        zone.area.center.x() += 0.2;
        zone.area.center.z() += 0.1;
        return;
    }

    const Vector3D direction = offset / length;
    const Vector3D combined = zone.area.half_extents() + reference.area.half_extents();

    // Distance along `direction` at which the volumes stop touching on some axis
    double separation = std::numeric_limits<double>::infinity();
    for (int axis = 0; axis < 3; ++axis) {
        const double component = std::abs(direction[axis]);
        if (component > 1e-12) {
            separation = std::min(separation, combined[axis] / component);
        }
    }

    zone.area.center = reference.area.center + direction * (separation * (1.0 + SEPARATION_MARGIN));
}

std::vector<ReferenceZone> ReferenceZoneGenerator::optimize_zone_layout(const std::vector<ReferenceZone>& zones) const {
    std::vector<ReferenceZone> result = zones;
    std::stable_sort(result.begin(), result.end(),
                     [](const ReferenceZone& a, const ReferenceZone& b) { return a.priority < b.priority; });

    size_t displaced = 0;
    for (size_t i = 1; i < result.size(); ++i) {
        bool clear = false;
        for (int pass = 0; pass < MAX_RESOLUTION_PASSES && !clear; ++pass) {
            clear = true;
            for (size_t j = 0; j < i; ++j) {
                if (zones_overlap(result[i], result[j])) {
                    separate_from(result[i], result[j]);
                    clear = false;
                    ++displaced;
                }
            }
        }
        const bool still_overlapping = std::any_of(result.begin(), result.begin() + i,
            [&](const ReferenceZone& placed) { return zones_overlap(result[i], placed); });
        if (still_overlapping) {
            LOG_WARN("Zone '", result[i].id, "' still overlaps after ", MAX_RESOLUTION_PASSES, " passes");
        }
    }

    LOG_DEBUG("Zone layout resolved with ", displaced, " displacements");
    return result;
}

} // namespace signspace
