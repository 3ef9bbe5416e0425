#pragma once

#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace signspace {

// Points and displacement vectors in signing-space units
using Point3D = Eigen::Vector3d;
using Vector3D = Eigen::Vector3d;

// Open key/value bag for fields no algorithm depends on
using Extensions = std::map<std::string, std::string>;

/**
 * Axis-aligned volume: center plus full extents along x (width),
 * y (height) and z (depth).
 */
struct Area3D {
    Point3D center = Point3D::Zero();
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;

    Vector3D half_extents() const noexcept {
        return Vector3D(width * 0.5, height * 0.5, depth * 0.5);
    }

    double largest_dimension() const noexcept {
        return std::max({width, height, depth});
    }

    bool has_positive_size() const noexcept {
        return width > 0.0 && height > 0.0 && depth > 0.0;
    }
};

inline bool is_finite(const Point3D& p) noexcept {
    return std::isfinite(p.x()) && std::isfinite(p.y()) && std::isfinite(p.z());
}

inline double clamp_unit(double value) noexcept {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

// True when the two volumes intersect on every axis
inline bool volumes_overlap(const Area3D& a, const Area3D& b, double factor = 1.0) noexcept {
    const Vector3D offset = (a.center - b.center).cwiseAbs();
    const Vector3D combined = (a.half_extents() + b.half_extents()) * factor;
    return offset.x() < combined.x() && offset.y() < combined.y() && offset.z() < combined.z();
}

// =============================================================================
// Cultural context
// =============================================================================

enum class ContextTag : uint8_t {
    Educational = 0,
    Conversational = 1,
    Narrative = 2,
    Technical = 3,
    Custom = 4
};

const char* context_tag_name(ContextTag tag) noexcept;
std::optional<ContextTag> parse_context_tag(std::string_view name) noexcept;

struct CulturalContext {
    std::string region = "france";
    double formality_level = 0.5;             // [0,1]
    ContextTag tag = ContextTag::Conversational;
    std::string custom_tag;                   // meaningful when tag == Custom
    std::optional<std::string> dialect;
    std::map<std::string, std::string> parameters;

    // "educational", ... or the custom tag itself
    std::string tag_label() const;

    // Formality clamped to [0,1]
    double formality() const noexcept { return clamp_unit(formality_level); }

    bool parameter_flag(const std::string& key) const;
    std::string parameter_or(const std::string& key, const std::string& fallback) const;
};

} // namespace signspace
