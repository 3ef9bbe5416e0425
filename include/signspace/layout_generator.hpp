#pragma once

#include "signspace/layout.hpp"
#include "signspace/proforme_registry.hpp"
#include "signspace/signing_space.hpp"
#include "signspace/types.hpp"
#include <vector>

namespace signspace {

/**
 * Layout Generator
 *
 * Places elements into zones, derives hierarchy / alignment / containment
 * relations, then runs a fixed-cap overlap resolution and a visibility pass.
 * Entity and container elements are bound to an active proforme when the
 * registry has one for the concept they stand for.
 */
class LayoutGenerator {
public:
    static constexpr double DISTRIBUTION_RADIUS = 0.3;
    static constexpr int MAX_OVERLAP_ITERATIONS = 5;
    static constexpr double OVERLAP_MARGIN = 1.1;
    static constexpr size_t SALIENT_ELEMENT_COUNT = 3;
    static constexpr double SALIENCE_DEPTH_FACTOR = 0.9;
    static constexpr double SALIENCE_LIFT = 0.05;

    LayoutGenerator(const SigningSpace& space, const ProformeRegistry& proformes)
        : space_(space), proformes_(proformes) {}

    // Throws LayoutError when the result fails validate_layout()
    SpatialLayout generate_layout(const std::vector<ReferenceZone>& zones,
                                  const CulturalContext* context = nullptr) const;

    void place_elements(SpatialLayout& layout) const;
    void create_relations(SpatialLayout& layout) const;
    void optimize_element_positions(SpatialLayout& layout) const;
    bool validate_layout(const SpatialLayout& layout) const;

    static bool elements_overlap(const SpatialElement& a, const SpatialElement& b) noexcept;
    static bool is_element_in_container(const SpatialElement& element, const SpatialElement& container) noexcept;

    // Importance-weighted split: the less important element moves further
    static void resolve_overlap(SpatialElement& a, SpatialElement& b) noexcept;

    // Pairwise passes until clear or MAX_OVERLAP_ITERATIONS; returns passes run
    static int resolve_element_overlaps(std::vector<SpatialElement*>& elements) noexcept;

private:
    void place_actant(const ReferenceZone& zone, SpatialLayout& layout) const;
    void place_time_markers(const ReferenceZone& zone, SpatialLayout& layout) const;
    void place_topic_marker(const ReferenceZone& zone, SpatialLayout& layout) const;
    void place_container(const ReferenceZone& zone, SpatialLayout& layout) const;
    void place_abstract_concept(const ReferenceZone& zone, SpatialLayout& layout) const;

    std::optional<std::string> proforme_for(const char* concept_name, const char* fallback) const;

    void distribute_elements(std::vector<SpatialElement*>& elements, const Point3D& center) const;
    void optimize_element_visibility(std::vector<SpatialElement*>& elements) const;

    const SigningSpace& space_;
    const ProformeRegistry& proformes_;
};

} // namespace signspace
