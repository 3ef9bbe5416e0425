#include "signspace/signing_space.hpp"
#include "signspace/error.hpp"
#include "signspace/logging.hpp"

#include <algorithm>

namespace signspace {

namespace {

constexpr double DEFAULT_EXTENT = 2.0;
constexpr double FORMAL_REGISTER_THRESHOLD = 0.7;

ReferenceZone make_neutral_center() {
    ReferenceZone zone;
    zone.id = "neutral-center";
    zone.name = "Neutral Center";
    zone.kind = ZoneKind::Neutral;
    zone.area = Area3D{Point3D::Zero(), 0.5, 0.5, 0.5};
    zone.significance = 0.8;
    zone.priority = 2;
    zone.metadata = NeutralMetadata{};
    return zone;
}

ReferenceZone make_formal_space() {
    ReferenceZone zone;
    zone.id = "formal-space";
    zone.name = "Formal Space";
    zone.kind = ZoneKind::Neutral;
    zone.area = Area3D{Point3D(0.0, 0.1, 0.2), 0.6, 0.4, 0.3};
    zone.significance = 0.7;
    zone.priority = 3;
    zone.metadata = NeutralMetadata{};
    zone.extensions["register"] = "formal";
    return zone;
}

} // anonymous namespace

SigningSpace::SigningSpace()
    : scale_(DEFAULT_SCALE)
    , origin_(Point3D::Zero())
    , orientation_(Vector3D::Zero())
    , bounds_{Point3D::Zero(), DEFAULT_EXTENT, DEFAULT_EXTENT, DEFAULT_EXTENT} {}

void SigningSpace::initialize(const CulturalContext& context) {
    reset();

    const double formality = context.formality();
    scale_ = 0.8 + formality * 0.4;

    add_zone(make_neutral_center());
    if (formality > FORMAL_REGISTER_THRESHOLD) {
        add_zone(make_formal_space());
    }

    LOG_DEBUG("Signing space initialized for region '", context.region,
              "' (scale=", scale_, ", zones=", zones_.size(), ")");
}

void SigningSpace::configure(const SigningSpaceParams& params) {
    if (params.scale) {
        SIGNSPACE_CHECK_ARGUMENT(std::isfinite(*params.scale) && *params.scale > 0.0,
                                 "Signing space scale must be positive and finite");
        scale_ = *params.scale;
    }
    if (params.orientation) {
        SIGNSPACE_CHECK_ARGUMENT(is_finite(*params.orientation), "Orientation must be finite");
        orientation_ = *params.orientation;
    }
    if (params.origin) {
        SIGNSPACE_CHECK_ARGUMENT(is_finite(*params.origin), "Origin must be finite");
        origin_ = *params.origin;
    }
    if (params.size) {
        const Vector3D& size = *params.size;
        SIGNSPACE_CHECK_ARGUMENT(is_finite(size) && (size.array() > 0.0).all(),
                                 "Signing space size must be positive on every axis");
        bounds_.width = size.x();
        bounds_.height = size.y();
        bounds_.depth = size.z();
    }
}

bool SigningSpace::add_zone(const ReferenceZone& zone) {
    if (zone.id.empty()) {
        LOG_WARN("Rejecting zone without id");
        return false;
    }
    auto [it, inserted] = zones_.emplace(zone.id, zone);
    if (!inserted) {
        LOG_DEBUG("Zone '", zone.id, "' already registered");
    }
    return inserted;
}

bool SigningSpace::remove_zone(const std::string& id) {
    return zones_.erase(id) != 0;
}

const ReferenceZone* SigningSpace::get_zone(const std::string& id) const {
    auto it = zones_.find(id);
    return it != zones_.end() ? &it->second : nullptr;
}

std::vector<ReferenceZone> SigningSpace::zones() const {
    std::vector<ReferenceZone> result;
    result.reserve(zones_.size());
    for (const auto& [id, zone] : zones_) {
        result.push_back(zone);
    }
    std::sort(result.begin(), result.end(),
              [](const ReferenceZone& a, const ReferenceZone& b) { return a.id < b.id; });
    return result;
}

Point3D SigningSpace::transform_to_space(const Point3D& world) const noexcept {
    return (world - origin_) / scale_;
}

Point3D SigningSpace::transform_from_space(const Point3D& local) const noexcept {
    return local * scale_ + origin_;
}

SigningSpace SigningSpace::clone() const {
    // Zones are held by value, so the copy shares nothing with this instance
    return SigningSpace(*this);
}

void SigningSpace::reset() {
    scale_ = DEFAULT_SCALE;
    origin_ = Point3D::Zero();
    orientation_ = Vector3D::Zero();
    bounds_ = Area3D{Point3D::Zero(), DEFAULT_EXTENT, DEFAULT_EXTENT, DEFAULT_EXTENT};
    zones_.clear();
}

bool SigningSpace::contains_point(const Point3D& local) const noexcept {
    const Vector3D offset = (local - bounds_.center).cwiseAbs();
    const Vector3D half = bounds_.half_extents();
    return (offset.array() <= half.array()).all();
}

} // namespace signspace
