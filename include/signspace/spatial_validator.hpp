#pragma once

#include "signspace/layout.hpp"
#include "signspace/proforme_registry.hpp"
#include "signspace/zone.hpp"
#include <map>
#include <string>
#include <vector>

namespace signspace {

struct ValidationScores {
    double zone_coherence = 0.0;
    double relation_consistency = 0.0;
    double proforme_usage = 0.0;

    double lowest() const noexcept;
    std::map<std::string, double> as_map() const;
};

/**
 * Spatial Validator - weighted coherence scoring of a layout.
 *
 * Zone coherence penalises overlapping zone pairs in proportion to how far
 * they encroach and rewards coverage. Relation consistency penalises
 * dangling endpoints and contradictory relation kinds on one pair. Proforme
 * usage is high unless elements reference proformes that are not active.
 * Activity is judged against the layout's own snapshot when it carries one,
 * otherwise against the registry given at construction.
 */
class SpatialValidator {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.85;

    static constexpr double ZONE_BASELINE = 0.7;
    static constexpr double OVERLAP_PENALTY = 0.2;
    static constexpr double COVERAGE_WEIGHT = 0.3;
    static constexpr double COVERAGE_ZONE_COUNT = 5.0;

    static constexpr double DANGLING_PENALTY = 0.2;
    static constexpr double CONTRADICTION_PENALTY = 0.1;
    static constexpr size_t MAX_KINDS_PER_PAIR = 2;

    static constexpr double PROFORME_BASELINE = 0.9;
    static constexpr double INACTIVE_PROFORME_PENALTY = 0.2;

    static constexpr double SPATIAL_WEIGHT = 0.4;
    static constexpr double REFERENCE_WEIGHT = 0.3;
    static constexpr double PROFORME_WEIGHT = 0.3;

    explicit SpatialValidator(double threshold = DEFAULT_THRESHOLD,
                              const ProformeRegistry* registry = nullptr)
        : threshold_(threshold), registry_(registry) {}

    double validate_zone_coherence(const std::vector<ReferenceZone>& zones) const;
    double validate_relation_consistency(const SpatialLayout& layout) const;
    double validate_proforme_usage(const SpatialLayout& layout) const;

    // 0.4 spatial + 0.3 reference + 0.3 proforme
    double measure_coherence(const SpatialLayout& layout) const;

    ValidationScores score(const SpatialLayout& layout) const;

    // Throws ValidationError carrying every score when one is below threshold
    ValidationScores validate_structure(const SpatialLayout& layout) const;

    double threshold() const noexcept { return threshold_; }

private:
    double threshold_;
    const ProformeRegistry* registry_;
};

// Fraction of the combined half-extent still shared on the least-overlapping axis
double zone_encroachment(const ReferenceZone& a, const ReferenceZone& b) noexcept;

} // namespace signspace
