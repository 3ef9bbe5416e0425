#pragma once

#include "signspace/signing_space.hpp"
#include "signspace/types.hpp"
#include "signspace/zone.hpp"
#include <vector>

namespace signspace {

/**
 * Reference Zone Generator
 * ========================
 *
 * Synthesizes typed zones for a cultural context and separates overlapping
 * zones with an asymmetric priority policy:
 *
 *   - zones are processed in ascending priority value (1 before 2);
 *     equal priorities keep generation order
 *   - a zone is only ever displaced away from zones processed before it,
 *     along the center-to-center vector, by the smallest distance that
 *     separates the two volumes on one axis, plus a 5% margin
 *   - coincident centers get a fixed offset instead of a direction
 *
 * Each zone is re-checked against every earlier zone until it is clear or
 * the pass cap is reached, so results are deterministic.
 */
class ReferenceZoneGenerator {
public:
    static constexpr double SEPARATION_MARGIN = 0.05;
    static constexpr double COINCIDENT_EPSILON = 1e-3;
    static constexpr int MAX_RESOLUTION_PASSES = 8;

    explicit ReferenceZoneGenerator(SigningSpace& space) : space_(space) {}

    // All kinds, optimized, then registered into the signing space
    std::vector<ReferenceZone> generate_zones(const CulturalContext& context);

    std::vector<ReferenceZone> generate_zones_by_type(const CulturalContext& context, ZoneKind kind) const;

    // Returns a resolved copy sorted by priority; the input is left untouched
    std::vector<ReferenceZone> optimize_zone_layout(const std::vector<ReferenceZone>& zones) const;

    static bool zones_overlap(const ReferenceZone& a, const ReferenceZone& b) noexcept;

    // Move `zone` away from `reference` until their volumes separate
    static void separate_from(ReferenceZone& zone, const ReferenceZone& reference) noexcept;

private:
    std::vector<ReferenceZone> create_timeline_zones(const CulturalContext& context) const;
    std::vector<ReferenceZone> create_actant_zones(const CulturalContext& context) const;
    std::vector<ReferenceZone> create_topic_zones(const CulturalContext& context) const;
    std::vector<ReferenceZone> create_neutral_zones(const CulturalContext& context) const;
    std::vector<ReferenceZone> create_abstract_zones(const CulturalContext& context) const;
    std::vector<ReferenceZone> create_container_zones(const CulturalContext& context) const;

    SigningSpace& space_;
};

// Side of the actant cubes: 0.4 at neutral formality, +/-0.05 at the extremes
double actant_zone_size(double formality) noexcept;

} // namespace signspace
