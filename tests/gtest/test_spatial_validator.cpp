// =============================================================================
// Spatial Validator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "signspace/error.hpp"
#include "signspace/layout_generator.hpp"
#include "signspace/spatial_validator.hpp"
#include "signspace/zone_generator.hpp"

using namespace signspace;

class SpatialValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        context.region = "france";
        context.formality_level = 0.5;
        space.initialize(context);
        registry.prepare_for_context(context);

        ReferenceZoneGenerator zone_generator(space);
        LayoutGenerator layout_generator(space, registry);
        layout = layout_generator.generate_layout(zone_generator.generate_zones(context), &context);
    }

    static ReferenceZone unit_zone(const std::string& id, const Point3D& center) {
        ReferenceZone zone;
        zone.id = id;
        zone.area = Area3D{center, 1.0, 1.0, 1.0};
        return zone;
    }

    static SpatialRelation relation(const std::string& source, const std::string& target, RelationKind kind) {
        SpatialRelation r;
        r.id = "r-" + source + "-" + target;
        r.kind = kind;
        r.source_id = source;
        r.target_id = target;
        return r;
    }

    CulturalContext context;
    SigningSpace space;
    ProformeRegistry registry;
    SpatialLayout layout;
};

TEST_F(SpatialValidatorTest, GeneratedLayoutPassesDefaultThreshold) {
    SpatialValidator validator(SpatialValidator::DEFAULT_THRESHOLD, &registry);

    ValidationScores scores;
    EXPECT_NO_THROW(scores = validator.validate_structure(layout));
    EXPECT_DOUBLE_EQ(scores.zone_coherence, 1.0);
    EXPECT_DOUBLE_EQ(scores.relation_consistency, 1.0);
    EXPECT_DOUBLE_EQ(scores.proforme_usage, 0.9);
}

TEST_F(SpatialValidatorTest, OverlappingZonesLowerCoherence) {
    SpatialValidator validator;
    const std::vector<ReferenceZone> separate{unit_zone("a", Point3D::Zero()), unit_zone("b", Point3D(2, 0, 0))};
    const std::vector<ReferenceZone> coincident{unit_zone("a", Point3D::Zero()), unit_zone("b", Point3D::Zero())};

    const double clear = validator.validate_zone_coherence(separate);
    const double overlapping = validator.validate_zone_coherence(coincident);

    EXPECT_NEAR(clear, 0.7 + 0.4 * 0.3, 1e-12);
    EXPECT_NEAR(overlapping, 0.7 - 0.2 + 0.4 * 0.3, 1e-12);
}

TEST_F(SpatialValidatorTest, EncroachmentIsProportional) {
    const auto a = unit_zone("a", Point3D::Zero());
    EXPECT_DOUBLE_EQ(zone_encroachment(a, unit_zone("b", Point3D::Zero())), 1.0);
    EXPECT_NEAR(zone_encroachment(a, unit_zone("b", Point3D(0.5, 0, 0))), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(zone_encroachment(a, unit_zone("b", Point3D(3, 0, 0))), 0.0);
}

TEST_F(SpatialValidatorTest, DanglingRelationScoresLower) {
    SpatialValidator validator;
    const double before = validator.validate_relation_consistency(layout);

    layout.relations.push_back(relation("actant-actant-left", "ghost", RelationKind::Hierarchy));
    const double after = validator.validate_relation_consistency(layout);

    EXPECT_LT(after, before);
    EXPECT_NEAR(before - after, SpatialValidator::DANGLING_PENALTY, 1e-12);
}

TEST_F(SpatialValidatorTest, ContradictoryRelationKinds) {
    SpatialValidator validator;
    SpatialLayout small;
    for (const char* id : {"a", "b"}) {
        SpatialElement element;
        element.id = id;
        small.elements[id] = element;
    }
    small.relations.push_back(relation("a", "b", RelationKind::Hierarchy));
    small.relations.push_back(relation("a", "b", RelationKind::Alignment));
    EXPECT_DOUBLE_EQ(validator.validate_relation_consistency(small), 1.0);

    small.relations.push_back(relation("a", "b", RelationKind::Containment));
    EXPECT_NEAR(validator.validate_relation_consistency(small), 0.9, 1e-12);
}

TEST_F(SpatialValidatorTest, InactiveProformePenalised) {
    SpatialValidator validator(SpatialValidator::DEFAULT_THRESHOLD, &registry);
    const double before = validator.validate_proforme_usage(layout);

    layout.elements.begin()->second.proforme_id = "region-quebec-vehicle";
    const double after = validator.validate_proforme_usage(layout);

    EXPECT_NEAR(before - after, SpatialValidator::INACTIVE_PROFORME_PENALTY, 1e-12);
}

TEST_F(SpatialValidatorTest, ProformeUsageWithoutRegistry) {
    SpatialValidator validator;
    EXPECT_DOUBLE_EQ(validator.validate_proforme_usage(layout), SpatialValidator::PROFORME_BASELINE);
}

TEST_F(SpatialValidatorTest, MeasureCoherenceIsWeighted) {
    SpatialValidator validator(SpatialValidator::DEFAULT_THRESHOLD, &registry);
    const ValidationScores scores = validator.score(layout);

    EXPECT_NEAR(validator.measure_coherence(layout),
                0.4 * scores.zone_coherence + 0.3 * scores.relation_consistency + 0.3 * scores.proforme_usage,
                1e-12);
}

TEST_F(SpatialValidatorTest, BelowThresholdThrowsWithScores) {
    SpatialValidator validator(0.95, &registry);
    try {
        validator.validate_structure(layout);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_FAILED);
        EXPECT_DOUBLE_EQ(e.threshold(), 0.95);
        ASSERT_EQ(e.scores().size(), 3u);
        EXPECT_DOUBLE_EQ(e.scores().at("proforme_usage"), 0.9);
        EXPECT_DOUBLE_EQ(e.scores().at("zone_coherence"), 1.0);
    }
}

TEST_F(SpatialValidatorTest, LowestScore) {
    ValidationScores scores{0.9, 0.4, 0.8};
    EXPECT_DOUBLE_EQ(scores.lowest(), 0.4);
}

TEST_F(SpatialValidatorTest, ProformeUsageUsesLayoutSnapshot) {
    SpatialValidator validator(SpatialValidator::DEFAULT_THRESHOLD, &registry);
    ASSERT_TRUE(layout.active_proformes.has_value());

    CulturalContext quebec = context;
    quebec.region = "quebec";
    registry.prepare_for_context(quebec);

    EXPECT_DOUBLE_EQ(validator.validate_proforme_usage(layout), SpatialValidator::PROFORME_BASELINE);

    layout.active_proformes.reset();
    EXPECT_LT(validator.validate_proforme_usage(layout), SpatialValidator::PROFORME_BASELINE);
}
