// =============================================================================
// Reference Zone Generator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "signspace/zone_generator.hpp"

#include <algorithm>

using namespace signspace;

class ZoneGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        context.region = "france";
        context.formality_level = 0.5;
        context.tag = ContextTag::Conversational;
    }

    static ReferenceZone unit_zone(const std::string& id, const Point3D& center, int priority = 0) {
        ReferenceZone zone;
        zone.id = id;
        zone.name = id;
        zone.area = Area3D{center, 1.0, 1.0, 1.0};
        zone.priority = priority;
        return zone;
    }

    static void expect_no_overlaps(const std::vector<ReferenceZone>& zones) {
        for (size_t i = 0; i < zones.size(); ++i) {
            for (size_t j = i + 1; j < zones.size(); ++j) {
                EXPECT_FALSE(ReferenceZoneGenerator::zones_overlap(zones[i], zones[j]))
                    << zones[i].id << " overlaps " << zones[j].id;
            }
        }
    }

    static const ReferenceZone* find(const std::vector<ReferenceZone>& zones, const std::string& id) {
        auto it = std::find_if(zones.begin(), zones.end(), [&](const ReferenceZone& z) { return z.id == id; });
        return it != zones.end() ? &*it : nullptr;
    }

    SigningSpace space;
    CulturalContext context;
};

TEST_F(ZoneGeneratorTest, ActantZonesForNeutralFormality) {
    ReferenceZoneGenerator generator(space);
    auto actants = generator.generate_zones_by_type(context, ZoneKind::Actant);

    ASSERT_EQ(actants.size(), 2u);
    EXPECT_EQ(actants[0].id, "actant-left");
    EXPECT_DOUBLE_EQ(actants[0].area.center.x(), -0.7);
    EXPECT_DOUBLE_EQ(actants[1].area.center.x(), 0.7);
    EXPECT_NEAR(actants[0].area.width, 0.4, 1e-12);
    EXPECT_NEAR(actants[1].area.depth, 0.4, 1e-12);

    const auto* meta = actants[0].metadata_as<ActantMetadata>();
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(meta->default_role, "subject");
}

TEST_F(ZoneGeneratorTest, ActantSizeTracksFormality) {
    EXPECT_NEAR(actant_zone_size(0.0), 0.35, 1e-12);
    EXPECT_NEAR(actant_zone_size(0.5), 0.40, 1e-12);
    EXPECT_NEAR(actant_zone_size(1.0), 0.45, 1e-12);
}

TEST_F(ZoneGeneratorTest, DefaultContextProducesCoreZones) {
    ReferenceZoneGenerator generator(space);
    auto zones = generator.generate_zones(context);

    ASSERT_EQ(zones.size(), 5u);
    EXPECT_NE(find(zones, "timeline-main"), nullptr);
    EXPECT_NE(find(zones, "actant-left"), nullptr);
    EXPECT_NE(find(zones, "actant-right"), nullptr);
    EXPECT_NE(find(zones, "topic-main"), nullptr);
    EXPECT_NE(find(zones, "neutral-center"), nullptr);
    EXPECT_EQ(find(zones, "abstract-concepts"), nullptr);
    EXPECT_EQ(find(zones, "container-main"), nullptr);
}

TEST_F(ZoneGeneratorTest, GeneratedZonesDoNotOverlap) {
    ReferenceZoneGenerator generator(space);
    expect_no_overlaps(generator.generate_zones(context));

    context.formality_level = 1.0;
    context.tag = ContextTag::Custom;
    context.custom_tag = "abstract-reasoning";
    context.parameters["hasContainers"] = "true";
    expect_no_overlaps(generator.generate_zones(context));
}

TEST_F(ZoneGeneratorTest, ZonesOrderedByPriority) {
    ReferenceZoneGenerator generator(space);
    auto zones = generator.generate_zones(context);

    for (size_t i = 1; i < zones.size(); ++i) {
        EXPECT_LE(zones[i - 1].priority, zones[i].priority);
    }
    // Priority 1 is never displaced
    EXPECT_EQ(zones.front().id, "timeline-main");
    EXPECT_NEAR((zones.front().area.center - Point3D(0.0, 0.0, 0.5)).norm(), 0.0, 1e-12);
}

TEST_F(ZoneGeneratorTest, GeneratedZonesRegisteredInSpace) {
    space.initialize(context);
    ReferenceZoneGenerator generator(space);
    auto zones = generator.generate_zones(context);

    for (const auto& zone : zones) {
        const ReferenceZone* registered = space.get_zone(zone.id);
        ASSERT_NE(registered, nullptr) << zone.id;
        EXPECT_NEAR((registered->area.center - zone.area.center).norm(), 0.0, 1e-12);
    }
}

TEST_F(ZoneGeneratorTest, AbstractZoneOnlyForAbstractReasoning) {
    ReferenceZoneGenerator generator(space);
    EXPECT_TRUE(generator.generate_zones_by_type(context, ZoneKind::Abstract).empty());

    context.tag = ContextTag::Custom;
    context.custom_tag = "abstract-reasoning";
    auto zones = generator.generate_zones_by_type(context, ZoneKind::Abstract);
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].id, "abstract-concepts");
    EXPECT_EQ(zones[0].priority, 4);
}

TEST_F(ZoneGeneratorTest, ContainerZoneFromParameters) {
    ReferenceZoneGenerator generator(space);
    EXPECT_TRUE(generator.generate_zones_by_type(context, ZoneKind::Container).empty());

    context.parameters["hasContainers"] = "true";
    context.parameters["containerType"] = "box";
    auto zones = generator.generate_zones_by_type(context, ZoneKind::Container);
    ASSERT_EQ(zones.size(), 1u);

    const auto* meta = zones[0].metadata_as<ContainerMetadata>();
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(meta->container_type, "box");
}

TEST_F(ZoneGeneratorTest, TimelineDirectionDependsOnRegion) {
    ReferenceZoneGenerator generator(space);
    auto france = generator.generate_zones_by_type(context, ZoneKind::Timeline);
    ASSERT_EQ(france.size(), 1u);
    EXPECT_EQ(france[0].metadata_as<TimelineMetadata>()->direction, "left-to-right");

    context.region = "quebec";
    auto quebec = generator.generate_zones_by_type(context, ZoneKind::Timeline);
    EXPECT_EQ(quebec[0].metadata_as<TimelineMetadata>()->direction, "context-dependent");
}

TEST_F(ZoneGeneratorTest, TopicEmphasisFollowsFormality) {
    ReferenceZoneGenerator generator(space);
    EXPECT_EQ(generator.generate_zones_by_type(context, ZoneKind::Topic)[0]
                  .metadata_as<TopicMetadata>()->emphasis, "standard");

    context.formality_level = 0.9;
    context.parameters["thematicField"] = "history";
    auto topic = generator.generate_zones_by_type(context, ZoneKind::Topic);
    EXPECT_EQ(topic[0].metadata_as<TopicMetadata>()->emphasis, "formal");
    EXPECT_EQ(topic[0].metadata_as<TopicMetadata>()->thematic_field, "history");
}

TEST_F(ZoneGeneratorTest, OverlappingUnitZonesAreSeparated) {
    ReferenceZoneGenerator generator(space);
    std::vector<ReferenceZone> input{
        unit_zone("first", Point3D(0.0, 0.0, 0.0)),
        unit_zone("second", Point3D(0.2, 0.2, 0.2)),
    };
    ASSERT_TRUE(ReferenceZoneGenerator::zones_overlap(input[0], input[1]));

    auto resolved = generator.optimize_zone_layout(input);

    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_FALSE(ReferenceZoneGenerator::zones_overlap(resolved[0], resolved[1]));
    // Earlier zone of equal priority stays put
    EXPECT_EQ(resolved[0].id, "first");
    EXPECT_TRUE(resolved[0].area.center.isZero());
    // Moved along the center-to-center direction
    EXPECT_NEAR(resolved[1].area.center.x(), resolved[1].area.center.y(), 1e-12);
    EXPECT_GT(resolved[1].area.center.x(), 0.2);
    // Input untouched
    EXPECT_NEAR(input[1].area.center.x(), 0.2, 1e-12);
}

TEST_F(ZoneGeneratorTest, LowerPriorityValueWins) {
    ReferenceZoneGenerator generator(space);
    std::vector<ReferenceZone> input{
        unit_zone("minor", Point3D(0.0, 0.0, 0.0), 5),
        unit_zone("major", Point3D(0.3, 0.0, 0.0), 1),
    };

    auto resolved = generator.optimize_zone_layout(input);

    EXPECT_EQ(resolved[0].id, "major");
    EXPECT_NEAR((resolved[0].area.center - Point3D(0.3, 0.0, 0.0)).norm(), 0.0, 1e-12);
    EXPECT_FALSE(ReferenceZoneGenerator::zones_overlap(resolved[0], resolved[1]));
}

TEST_F(ZoneGeneratorTest, CoincidentCentersGetFixedOffset) {
    ReferenceZone zone = unit_zone("a", Point3D::Zero());
    const ReferenceZone reference = unit_zone("b", Point3D::Zero());

    ReferenceZoneGenerator::separate_from(zone, reference);

    EXPECT_NEAR(zone.area.center.x(), 0.2, 1e-12);
    EXPECT_NEAR(zone.area.center.z(), 0.1, 1e-12);
}
