// =============================================================================
// Spatial Structure Manager Tests
// =============================================================================

#include <gtest/gtest.h>
#include "signspace/error.hpp"
#include "signspace/structure_manager.hpp"

using namespace signspace;

class StructureManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache = std::make_shared<StructureCache>();
        manager = std::make_unique<SpatialStructureManager>(cache);
        context.region = "france";
        context.formality_level = 0.5;
        context.tag = ContextTag::Educational;
    }

    std::shared_ptr<StructureCache> cache;
    std::unique_ptr<SpatialStructureManager> manager;
    CulturalContext context;
};

TEST_F(StructureManagerTest, RequiresCache) {
    EXPECT_THROW(SpatialStructureManager(nullptr), SignspaceException);
}

TEST_F(StructureManagerTest, GeneratesCompleteStructure) {
    auto structure = manager->generate_spatial_structure(context);
    ASSERT_NE(structure, nullptr);

    EXPECT_EQ(structure->zones.size(), 5u);
    EXPECT_EQ(structure->proformes.size(), 5u);
    EXPECT_EQ(structure->components.size(), 6u);
    EXPECT_EQ(structure->relations.size(), 7u);
    ASSERT_NE(structure->layout, nullptr);

    EXPECT_EQ(structure->metadata.element_count, structure->components.size());
    EXPECT_EQ(structure->metadata.relation_count, structure->relations.size());
    EXPECT_EQ(structure->metadata.context.region, "france");
    EXPECT_GT(structure->metadata.coherence_score, 0.0);
    EXPECT_LE(structure->metadata.coherence_score, 1.0);
    EXPECT_DOUBLE_EQ(structure->metadata.optimization_level, 1.0);
}

TEST_F(StructureManagerTest, RepeatedGenerationReturnsCachedInstance) {
    auto first = manager->generate_spatial_structure(context);
    auto second = manager->generate_spatial_structure(context);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_GE(manager->cache_stats().total_hits(), 1u);
}

TEST_F(StructureManagerTest, DifferentContextsAreDistinct) {
    auto neutral = manager->generate_spatial_structure(context);

    CulturalContext formal = context;
    formal.formality_level = 0.9;
    auto formal_structure = manager->generate_spatial_structure(formal);

    EXPECT_NE(neutral.get(), formal_structure.get());
    EXPECT_NE(neutral->id, formal_structure->id);
    EXPECT_NE(SpatialStructureManager::structure_cache_key(context),
              SpatialStructureManager::structure_cache_key(formal));
}

TEST_F(StructureManagerTest, ParametersChangeCacheKey) {
    CulturalContext with_containers = context;
    with_containers.parameters["hasContainers"] = "true";

    EXPECT_NE(SpatialStructureManager::structure_cache_key(context),
              SpatialStructureManager::structure_cache_key(with_containers));

    auto structure = manager->generate_spatial_structure(with_containers);
    EXPECT_EQ(structure->zones.size(), 6u);
}

TEST_F(StructureManagerTest, NearbyFormalityLevelsAreDistinct) {
    CulturalContext nearby = context;
    nearby.formality_level = 0.5000001;

    EXPECT_NE(SpatialStructureManager::structure_cache_key(context),
              SpatialStructureManager::structure_cache_key(nearby));

    auto first = manager->generate_spatial_structure(context);
    auto second = manager->generate_spatial_structure(nearby);
    EXPECT_NE(first.get(), second.get());
    EXPECT_DOUBLE_EQ(second->metadata.context.formality_level, 0.5000001);
}

TEST_F(StructureManagerTest, ValidationOfCachedStructureIgnoresLaterRegions) {
    auto france = manager->generate_spatial_structure(context);
    const double before = manager->validator().score(*france->layout).proforme_usage;

    CulturalContext quebec = context;
    quebec.region = "quebec";
    manager->generate_spatial_structure(quebec);

    const double after = manager->validator().score(*france->layout).proforme_usage;
    EXPECT_DOUBLE_EQ(after, before);
    EXPECT_DOUBLE_EQ(after, SpatialValidator::PROFORME_BASELINE);
    EXPECT_NO_THROW(manager->validator().validate_structure(*france->layout));
}

TEST_F(StructureManagerTest, ClearCacheForcesRegeneration) {
    auto first = manager->generate_spatial_structure(context);
    manager->clear_cache();
    auto second = manager->generate_spatial_structure(context);

    EXPECT_NE(first.get(), second.get());
    // The evicted instance stays valid for its holder
    EXPECT_EQ(first->zones.size(), 5u);
}

TEST_F(StructureManagerTest, GeneratedStructurePassesSelfCheck) {
    auto structure = manager->generate_spatial_structure(context);
    auto report = manager->validate_spatial_structure(*structure);

    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.issues.empty());
    EXPECT_DOUBLE_EQ(report.score, 1.0);
}

TEST_F(StructureManagerTest, GeneratedStructurePassesValidator) {
    auto structure = manager->generate_spatial_structure(context);
    EXPECT_NO_THROW(manager->validator().validate_structure(*structure->layout));
}

TEST_F(StructureManagerTest, SelfCheckReportsDanglingAndInvalidRelations) {
    SpatialStructure structure = *manager->generate_spatial_structure(context);

    SpatialRelation broken;
    broken.id = "broken";
    broken.kind = RelationKind::Hierarchy;
    broken.source_id = structure.components.front().id;
    broken.target_id = "ghost";
    broken.strength = 1.5;
    structure.relations.push_back(broken);

    auto report = manager->validate_spatial_structure(structure);

    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.issues.size(), 2u);
    EXPECT_LT(report.score, 1.0);
    EXPECT_GE(report.score, 0.0);
}

TEST_F(StructureManagerTest, SelfCheckReportsZoneProblems) {
    SpatialStructure structure;

    ReferenceZone a;
    a.id = "a";
    a.area = Area3D{Point3D::Zero(), 1.0, 1.0, 1.0};
    ReferenceZone b = a;
    b.id = "b";
    ReferenceZone flat = a;
    flat.id = "flat";
    flat.area = Area3D{Point3D(5.0, 0.0, 0.0), 0.0, 1.0, 1.0};
    structure.zones = {a, b, flat};

    auto report = manager->validate_spatial_structure(structure);

    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.issues.size(), 2u);   // a/b overlap, flat has no size
    EXPECT_NEAR(report.score, 1.0 - 2.0 / 3.0, 1e-12);
}

TEST_F(StructureManagerTest, SelfCheckReportsComponentAndProformeProblems) {
    SpatialStructure structure;
    structure.components.push_back(SpatialComponent{});   // no id, unknown kind, no properties
    Proforme proforme;
    proforme.id = "p";
    structure.proformes.push_back(proforme);               // no name, handshape, orientation

    auto report = manager->validate_spatial_structure(structure);

    EXPECT_EQ(report.issues.size(), 6u);
    EXPECT_DOUBLE_EQ(report.score, 0.0);
}

TEST_F(StructureManagerTest, EmptyStructureIsValid) {
    auto report = manager->validate_spatial_structure(SpatialStructure{});
    EXPECT_TRUE(report.valid);
    EXPECT_DOUBLE_EQ(report.score, 1.0);
}

TEST_F(StructureManagerTest, AnalysisIsCached) {
    auto input = AnalyzerInput::from_text("regarde montre maison");
    auto first = manager->analyze_spatial_structure(input);
    auto second = manager->analyze_spatial_structure(input);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->components.size(), 3u);

    auto other = manager->analyze_spatial_structure(AnalyzerInput::from_text("maison"));
    EXPECT_NE(first.get(), other.get());
}

TEST_F(StructureManagerTest, AnalysisKeyDependsOnInputType) {
    StructuredInput records;
    EXPECT_NE(SpatialStructureManager::analysis_cache_key(AnalyzerInput::from_text("")),
              SpatialStructureManager::analysis_cache_key(AnalyzerInput::from_records(records)));
}

TEST_F(StructureManagerTest, EmptyAnalysis) {
    auto analysis = manager->analyze_spatial_structure(AnalyzerInput::from_text(""));
    EXPECT_TRUE(analysis->components.empty());
    EXPECT_FALSE(analysis->metadata.warnings.empty());
    EXPECT_DOUBLE_EQ(analysis->metadata.statistics.coherence_score, 0.0);
}

TEST_F(StructureManagerTest, StructuresAndAnalysesShareCache) {
    manager->generate_spatial_structure(context);
    manager->analyze_spatial_structure(AnalyzerInput::from_text("maison"));
    EXPECT_EQ(cache->size(CacheLevel::L2), 2u);
}

TEST_F(StructureManagerTest, AsyncVariants) {
    auto structure_future = manager->generate_spatial_structure_async(context);
    auto analysis_future = manager->analyze_spatial_structure_async(AnalyzerInput::from_text("a b"));

    auto structure = structure_future.get();
    auto analysis = analysis_future.get();

    ASSERT_NE(structure, nullptr);
    EXPECT_EQ(structure.get(), manager->generate_spatial_structure(context).get());
    EXPECT_EQ(analysis->components.size(), 2u);
}

TEST_F(StructureManagerTest, ZoneOptimizationLevel) {
    ReferenceZone a;
    a.id = "a";
    a.area = Area3D{Point3D::Zero(), 1.0, 1.0, 1.0};
    ReferenceZone b = a;
    b.id = "b";
    ReferenceZone c = a;
    c.id = "c";
    c.area.center = Point3D(5.0, 0.0, 0.0);

    EXPECT_DOUBLE_EQ(zone_optimization_level({a}), 1.0);
    EXPECT_NEAR(zone_optimization_level({a, b, c}), 2.0 / 3.0, 1e-12);
}
