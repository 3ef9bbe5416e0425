#pragma once

#include "signspace/layout_generator.hpp"
#include "signspace/multi_level_cache.hpp"
#include "signspace/proforme_registry.hpp"
#include "signspace/signing_space.hpp"
#include "signspace/spatial_analyzer.hpp"
#include "signspace/spatial_validator.hpp"
#include "signspace/structure.hpp"
#include "signspace/zone_generator.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace signspace {

using StructureCacheValue = std::variant<SpatialStructure, SpatialAnalysis>;
using StructureCache = MultiLevelCache<StructureCacheValue>;

/**
 * Spatial Structure Manager
 * =========================
 *
 * Facade over the signing space, proforme registry, generators, analyzer and
 * validator. Results are cached in an injected MultiLevelCache and handed
 * out as shared read-only objects: a repeated call with the same context or
 * input returns the very same instance while it stays cached.
 *
 * Generation mutates the owned signing space and registry, so it runs under
 * the manager's mutex; analysis is stateless apart from the cache.
 */
class SpatialStructureManager {
public:
    static constexpr double SELF_CHECK_OVERLAP_FACTOR = 0.7;

    explicit SpatialStructureManager(std::shared_ptr<StructureCache> cache,
                                     AnalyzerConfig analyzer_config = {},
                                     double validation_threshold = SpatialValidator::DEFAULT_THRESHOLD);

    // Throws StructureGenerationError, or LayoutError unchanged
    std::shared_ptr<const SpatialStructure> generate_spatial_structure(const CulturalContext& context);

    std::shared_ptr<const SpatialAnalysis> analyze_spatial_structure(const AnalyzerInput& input);

    // Never throws: integrity issues are reported in the returned report
    StructureValidationReport validate_spatial_structure(const SpatialStructure& structure) const;

    std::future<std::shared_ptr<const SpatialStructure>> generate_spatial_structure_async(CulturalContext context);
    std::future<std::shared_ptr<const SpatialAnalysis>> analyze_spatial_structure_async(AnalyzerInput input);

    CacheStats cache_stats() const { return cache_->stats(); }
    void clear_cache() { cache_->clear(); }

    static std::string structure_cache_key(const CulturalContext& context);
    static std::string analysis_cache_key(const AnalyzerInput& input);

    const SpatialValidator& validator() const noexcept { return validator_; }

private:
    SpatialStructure build_structure(const CulturalContext& context);

    std::shared_ptr<StructureCache> cache_;
    std::mutex generation_mutex_;
    SigningSpace space_;
    ProformeRegistry proformes_;
    ReferenceZoneGenerator zone_generator_;
    LayoutGenerator layout_generator_;
    SpatialAnalyzer analyzer_;
    SpatialValidator validator_;
    uint64_t structure_counter_ = 0;
};

// Fraction of zone pairs whose volumes do not overlap; 1 for fewer than two zones
double zone_optimization_level(const std::vector<ReferenceZone>& zones) noexcept;

} // namespace signspace
