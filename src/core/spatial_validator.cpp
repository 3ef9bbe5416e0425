#include "signspace/spatial_validator.hpp"
#include "signspace/error.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace signspace {

double ValidationScores::lowest() const noexcept {
    return std::min({zone_coherence, relation_consistency, proforme_usage});
}

std::map<std::string, double> ValidationScores::as_map() const {
    return {
        {"zone_coherence", zone_coherence},
        {"relation_consistency", relation_consistency},
        {"proforme_usage", proforme_usage},
    };
}

double zone_encroachment(const ReferenceZone& a, const ReferenceZone& b) noexcept {
    const Vector3D offset = (a.area.center - b.area.center).cwiseAbs();
    const Vector3D combined = a.area.half_extents() + b.area.half_extents();

    double encroachment = 1.0;
    for (int axis = 0; axis < 3; ++axis) {
        if (combined[axis] <= 0.0) return 0.0;
        encroachment = std::min(encroachment, (combined[axis] - offset[axis]) / combined[axis]);
    }
    return std::max(0.0, encroachment);
}

double SpatialValidator::validate_zone_coherence(const std::vector<ReferenceZone>& zones) const {
    double score = ZONE_BASELINE;

    for (size_t i = 0; i < zones.size(); ++i) {
        for (size_t j = i + 1; j < zones.size(); ++j) {
            if (volumes_overlap(zones[i].area, zones[j].area)) {
                score -= OVERLAP_PENALTY * zone_encroachment(zones[i], zones[j]);
            }
        }
    }

    const double coverage = std::min(1.0, static_cast<double>(zones.size()) / COVERAGE_ZONE_COUNT);
    score += coverage * COVERAGE_WEIGHT;

    return clamp_unit(score);
}

double SpatialValidator::validate_relation_consistency(const SpatialLayout& layout) const {
    double score = 1.0;
    std::map<std::pair<std::string, std::string>, std::set<RelationKind>> kinds_per_pair;

    for (const auto& relation : layout.relations) {
        if (!layout.has_element(relation.source_id) || !layout.has_element(relation.target_id)) {
            score -= DANGLING_PENALTY;
        }
        kinds_per_pair[{relation.source_id, relation.target_id}].insert(relation.kind);
    }

    for (const auto& [pair, kinds] : kinds_per_pair) {
        if (kinds.size() > MAX_KINDS_PER_PAIR) {
            score -= CONTRADICTION_PENALTY;
        }
    }

    return clamp_unit(score);
}

double SpatialValidator::validate_proforme_usage(const SpatialLayout& layout) const {
    double score = PROFORME_BASELINE;
    if (!layout.active_proformes && !registry_) return score;

    auto is_active = [&](const std::string& proforme_id) {
        if (layout.active_proformes) return layout.active_proformes->count(proforme_id) != 0;
        return registry_->is_active(proforme_id);
    };

    for (const auto& [id, element] : layout.elements) {
        if (element.proforme_id && !is_active(*element.proforme_id)) {
            score -= INACTIVE_PROFORME_PENALTY;
        }
    }
    return clamp_unit(score);
}

double SpatialValidator::measure_coherence(const SpatialLayout& layout) const {
    const ValidationScores s = score(layout);
    return clamp_unit(SPATIAL_WEIGHT * s.zone_coherence +
                      REFERENCE_WEIGHT * s.relation_consistency +
                      PROFORME_WEIGHT * s.proforme_usage);
}

ValidationScores SpatialValidator::score(const SpatialLayout& layout) const {
    ValidationScores scores;
    scores.zone_coherence = validate_zone_coherence(layout.zones);
    scores.relation_consistency = validate_relation_consistency(layout);
    scores.proforme_usage = validate_proforme_usage(layout);
    return scores;
}

ValidationScores SpatialValidator::validate_structure(const SpatialLayout& layout) const {
    const ValidationScores scores = score(layout);

    if (scores.lowest() < threshold_) {
        std::ostringstream oss;
        oss << "Spatial structure below coherence threshold " << threshold_ << ":";
        for (const auto& [name, value] : scores.as_map()) {
            if (value < threshold_) oss << ' ' << name << '=' << value;
        }
        LOG_WARN(oss.str());
        throw ValidationError(oss.str(), scores.as_map(), threshold_, __func__);
    }

    return scores;
}

} // namespace signspace
