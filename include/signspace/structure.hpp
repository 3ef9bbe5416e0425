#pragma once

#include "signspace/analysis.hpp"
#include "signspace/layout.hpp"
#include "signspace/proforme.hpp"
#include "signspace/relation.hpp"
#include "signspace/types.hpp"
#include "signspace/zone.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace signspace {

struct StructureMetadata {
    std::chrono::system_clock::time_point created_at;
    CulturalContext context;
    double coherence_score = 0.0;
    double complexity_score = 0.0;
    double optimization_level = 0.0;   // fraction of zone pairs free of overlap
    size_t element_count = 0;
    size_t relation_count = 0;
};

/**
 * Aggregate produced by SpatialStructureManager::generate_spatial_structure().
 * Shared read-only once returned; callers copy before modifying.
 */
struct SpatialStructure {
    std::string id;
    std::vector<ReferenceZone> zones;
    std::vector<Proforme> proformes;
    std::vector<SpatialComponent> components;
    std::vector<SpatialRelation> relations;
    std::shared_ptr<const SpatialLayout> layout;
    StructureMetadata metadata;
};

struct StructureValidationReport {
    bool valid = true;
    std::vector<std::string> issues;
    double score = 1.0;
};

} // namespace signspace
