#pragma once

#include "signspace/types.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace signspace {

enum class ZoneKind : uint8_t {
    Timeline = 0,
    Actant = 1,
    Topic = 2,
    Neutral = 3,
    Abstract = 4,
    Container = 5
};

const char* zone_kind_name(ZoneKind kind) noexcept;

// =============================================================================
// Per-kind zone metadata
// =============================================================================

struct TimelineMetadata {
    std::string direction = "left-to-right";
    std::vector<std::string> segments{"past", "present", "future"};
};

struct ActantMetadata {
    std::string default_role = "generic";
    std::string contextual_usage = "standard";
};

struct TopicMetadata {
    std::string thematic_field = "general";
    std::string emphasis = "standard";
};

struct NeutralMetadata {};

struct AbstractMetadata {
    std::string concept_type = "abstract";
};

struct ContainerMetadata {
    std::string container_type = "generic";
};

using ZoneMetadata = std::variant<TimelineMetadata, ActantMetadata, TopicMetadata,
                                  NeutralMetadata, AbstractMetadata, ContainerMetadata>;

/**
 * A named, typed region of signing space used to anchor meaning.
 *
 * Lower priority values are more important: they are placed first during
 * overlap resolution and are never displaced by zones with larger values.
 */
struct ReferenceZone {
    std::string id;
    std::string name;
    ZoneKind kind = ZoneKind::Neutral;
    Area3D area;
    double significance = 0.5;   // [0,1]
    int priority = 0;
    ZoneMetadata metadata = NeutralMetadata{};
    Extensions extensions;       // culture-specific fields not used by any algorithm

    template<typename T>
    const T* metadata_as() const noexcept { return std::get_if<T>(&metadata); }
};

} // namespace signspace
