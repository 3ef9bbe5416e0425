// =============================================================================
// Proforme Registry Tests
// =============================================================================

#include <gtest/gtest.h>
#include "signspace/proforme_registry.hpp"

using namespace signspace;

class ProformeRegistryTest : public ::testing::Test {
protected:
    static CulturalContext context_for(const std::string& region, double formality) {
        CulturalContext context;
        context.region = region;
        context.formality_level = formality;
        return context;
    }

    ProformeRegistry registry;
};

TEST_F(ProformeRegistryTest, SeedsBaseSet) {
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.active_count(), 3u);
    EXPECT_NE(registry.get_proforme("base-index-pointing"), nullptr);
    EXPECT_NE(registry.get_proforme("base-flat-hand"), nullptr);
    EXPECT_NE(registry.get_proforme("base-c-handshape"), nullptr);
}

TEST_F(ProformeRegistryTest, FranceAddsRegionalProformes) {
    registry.prepare_for_context(context_for("france", 0.5));

    EXPECT_TRUE(registry.is_active("region-france-vehicle"));
    EXPECT_TRUE(registry.is_active("region-france-person"));
    EXPECT_EQ(registry.active_count(), 5u);
}

TEST_F(ProformeRegistryTest, SwitchingRegionDeactivatesPreviousOnes) {
    registry.prepare_for_context(context_for("france", 0.5));
    registry.prepare_for_context(context_for("Quebec", 0.5));

    EXPECT_FALSE(registry.is_active("region-france-vehicle"));
    EXPECT_TRUE(registry.is_active("region-quebec-vehicle"));
    EXPECT_EQ(registry.active_count(), 4u);
}

TEST_F(ProformeRegistryTest, UnknownRegionKeepsBaseOnly) {
    registry.prepare_for_context(context_for("belgium", 0.5));
    EXPECT_EQ(registry.active_count(), 3u);
    EXPECT_TRUE(ProformeRegistry::regional_proformes("belgium").empty());
}

TEST_F(ProformeRegistryTest, TensionIsMonotonicInFormality) {
    double previous = -1.0;
    for (double f : {0.0, 0.3, 0.6, 1.0}) {
        registry.prepare_for_context(context_for("france", f));
        const Proforme* p = registry.get_proforme("base-flat-hand");
        ASSERT_NE(p, nullptr);
        EXPECT_GT(p->handshape.tension, previous);
        EXPECT_NEAR(p->handshape.tension, 0.5 + f * 0.3, 1e-12);
        previous = p->handshape.tension;
    }
}

TEST_F(ProformeRegistryTest, PositionDerivedFromDefaultNotAccumulated) {
    registry.prepare_for_context(context_for("france", 1.0));
    const Point3D first = *registry.get_proforme("base-index-pointing")->position;

    registry.prepare_for_context(context_for("france", 1.0));
    const Point3D second = *registry.get_proforme("base-index-pointing")->position;

    EXPECT_NEAR((first - second).norm(), 0.0, 1e-12);
    EXPECT_NEAR(first.x(), 0.2 * 0.8, 1e-12);
}

TEST_F(ProformeRegistryTest, AdjustPositionForFormality) {
    const Point3D p = adjust_position_for_formality(Point3D(1.0, 0.0, 0.0), 1.0);
    EXPECT_NEAR(p.x(), 0.8, 1e-12);
    EXPECT_NEAR(p.y(), 0.02, 1e-12);
    EXPECT_NEAR(p.z(), -0.01, 1e-12);

    const Point3D unchanged = adjust_position_for_formality(Point3D(1.0, 2.0, 3.0), 0.0);
    EXPECT_NEAR((unchanged - Point3D(1.0, 2.0, 3.0)).norm(), 0.0, 1e-12);
}

TEST_F(ProformeRegistryTest, AddDuplicateFailsWithoutSideEffects) {
    Proforme p = *registry.get_proforme("base-flat-hand");
    p.represents = "something-else";

    EXPECT_FALSE(registry.add_proforme(p));
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_TRUE(registry.proformes_by_representation("something-else").empty());
    EXPECT_EQ(registry.proformes_by_representation("surface").size(), 1u);
}

TEST_F(ProformeRegistryTest, RemoveUpdatesConceptIndex) {
    EXPECT_TRUE(registry.remove_proforme("base-flat-hand"));
    EXPECT_FALSE(registry.remove_proforme("base-flat-hand"));
    EXPECT_TRUE(registry.proformes_by_representation("surface").empty());
    EXPECT_FALSE(registry.is_active("base-flat-hand"));
}

TEST_F(ProformeRegistryTest, RepresentationLookupIsCaseInsensitive) {
    auto found = registry.proformes_by_representation("Pointing-Reference");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "base-index-pointing");
}

TEST_F(ProformeRegistryTest, RepresentationLookupSkipsInactive) {
    registry.prepare_for_context(context_for("france", 0.5));
    EXPECT_EQ(registry.proformes_by_representation("vehicle").size(), 1u);

    registry.prepare_for_context(context_for("belgium", 0.5));
    EXPECT_TRUE(registry.proformes_by_representation("vehicle").empty());
}

TEST_F(ProformeRegistryTest, ResetRestoresBaseSet) {
    registry.prepare_for_context(context_for("france", 0.5));
    registry.reset();

    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.active_count(), 3u);
    EXPECT_EQ(registry.get_proforme("region-france-person"), nullptr);
}

TEST_F(ProformeRegistryTest, ActiveProformesOrderedById) {
    registry.prepare_for_context(context_for("france", 0.5));
    auto active = registry.active_proformes();
    ASSERT_EQ(active.size(), 5u);
    for (size_t i = 1; i < active.size(); ++i) {
        EXPECT_LT(active[i - 1].id, active[i].id);
    }
}
