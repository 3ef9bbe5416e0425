#pragma once

#include "signspace/types.hpp"
#include "signspace/zone.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace signspace {

/**
 * Partial override set for SigningSpace::configure(). Unset fields keep
 * their current value.
 */
struct SigningSpaceParams {
    std::optional<double> scale;
    std::optional<Vector3D> orientation;   // euler angles in degrees
    std::optional<Point3D> origin;
    std::optional<Vector3D> size;          // bounding volume extents
};

/**
 * Signing Space - the 3D coordinate frame of an utterance.
 *
 * Holds scale, origin, orientation, a bounding volume and a zone registry
 * keyed by zone id. Not internally synchronized: one instance per session,
 * or external locking by the owner.
 */
class SigningSpace {
public:
    static constexpr double DEFAULT_SCALE = 1.0;

    SigningSpace();

    // Reset, then seed the zones appropriate to the context
    void initialize(const CulturalContext& context);

    // Apply scale/orientation/origin/size overrides without touching zones
    void configure(const SigningSpaceParams& params);

    bool add_zone(const ReferenceZone& zone);
    bool remove_zone(const std::string& id);
    const ReferenceZone* get_zone(const std::string& id) const;
    bool has_zone(const std::string& id) const { return zones_.count(id) != 0; }

    // Zones ordered by id
    std::vector<ReferenceZone> zones() const;
    size_t zone_count() const noexcept { return zones_.size(); }

    // World -> space: translate by -origin, then divide by scale
    Point3D transform_to_space(const Point3D& world) const noexcept;

    // Space -> world: multiply by scale, then translate by origin
    Point3D transform_from_space(const Point3D& local) const noexcept;

    SigningSpace clone() const;
    void reset();

    double scale() const noexcept { return scale_; }
    const Point3D& origin() const noexcept { return origin_; }
    const Vector3D& orientation() const noexcept { return orientation_; }
    const Area3D& bounds() const noexcept { return bounds_; }

    bool contains_point(const Point3D& local) const noexcept;

private:
    double scale_;
    Point3D origin_;
    Vector3D orientation_;
    Area3D bounds_;
    std::unordered_map<std::string, ReferenceZone> zones_;
};

} // namespace signspace
