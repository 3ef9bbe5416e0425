#include "signspace/proforme_registry.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <cctype>

namespace signspace {

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HandshapeConfig make_handshape(const std::string& type, std::array<double, 5> bends,
                               std::array<double, 5> spreads, double tension) {
    HandshapeConfig shape;
    shape.type = type;
    for (size_t i = 0; i < shape.fingers.size(); ++i) {
        shape.fingers[i].finger = static_cast<Finger>(i);
        shape.fingers[i].bend = bends[i];
        shape.fingers[i].spread = spreads[i];
    }
    shape.tension = tension;
    return shape;
}

// Open hand, no bend or spread
HandshapeConfig basic_handshape(const std::string& type) {
    return make_handshape(type, {0, 0, 0, 0, 0}, {0, 0, 0, 0, 0}, 0.5);
}

Proforme make_regional(const std::string& id, const std::string& name, const std::string& shape,
                       const std::string& represents, std::vector<std::string> concepts,
                       const std::string& region) {
    Proforme p;
    p.id = id;
    p.name = name;
    p.handshape = basic_handshape(shape);
    p.orientation = HandOrientation{"down", "forward"};
    p.represents = represents;
    p.associated_concepts = std::move(concepts);
    p.cultural_context = {region};
    return p;
}

} // anonymous namespace

Point3D adjust_position_for_formality(const Point3D& position, double formality) noexcept {
    const double factor = clamp_unit(formality) * 0.2;
    return Point3D(position.x() * (1.0 - factor),
                   position.y() + factor * 0.1,
                   position.z() - factor * 0.05);
}

ProformeRegistry::ProformeRegistry() {
    seed_base_proformes();
}

void ProformeRegistry::prepare_for_context(const CulturalContext& context) {
    active_ids_.clear();

    for (const auto& [id, proforme] : proformes_) {
        if (id.rfind(BASE_PREFIX, 0) == 0) {
            active_ids_.insert(id);
        }
    }

    for (const auto& regional : regional_proformes(context.region)) {
        if (!proformes_.count(regional.id)) {
            add_proforme(regional);
        }
        active_ids_.insert(regional.id);
    }

    adapt_to_formality(context.formality());

    LOG_DEBUG("Prepared ", active_ids_.size(), " proformes for region '", context.region,
              "' at formality ", context.formality());
}

bool ProformeRegistry::add_proforme(const Proforme& proforme) {
    if (proforme.id.empty() || proformes_.count(proforme.id)) {
        return false;
    }

    proformes_.emplace(proforme.id, proforme);
    concept_index_[lowercase(proforme.represents)].insert(proforme.id);
    return true;
}

bool ProformeRegistry::remove_proforme(const std::string& id) {
    auto it = proformes_.find(id);
    if (it == proformes_.end()) {
        return false;
    }

    const std::string concept_key = lowercase(it->second.represents);
    auto concept_it = concept_index_.find(concept_key);
    if (concept_it != concept_index_.end()) {
        concept_it->second.erase(id);
        if (concept_it->second.empty()) {
            concept_index_.erase(concept_it);
        }
    }

    active_ids_.erase(id);
    proformes_.erase(it);
    return true;
}

const Proforme* ProformeRegistry::get_proforme(const std::string& id) const {
    auto it = proformes_.find(id);
    return it != proformes_.end() ? &it->second : nullptr;
}

std::vector<Proforme> ProformeRegistry::active_proformes() const {
    std::vector<Proforme> result;
    result.reserve(active_ids_.size());
    for (const auto& id : active_ids_) {
        if (const Proforme* p = get_proforme(id)) {
            result.push_back(*p);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Proforme& a, const Proforme& b) { return a.id < b.id; });
    return result;
}

std::vector<Proforme> ProformeRegistry::proformes_by_representation(const std::string& concept_name) const {
    std::vector<Proforme> result;
    auto it = concept_index_.find(lowercase(concept_name));
    if (it == concept_index_.end()) {
        return result;
    }

    for (const auto& id : it->second) {
        if (!is_active(id)) continue;
        if (const Proforme* p = get_proforme(id)) {
            result.push_back(*p);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Proforme& a, const Proforme& b) { return a.id < b.id; });
    return result;
}

void ProformeRegistry::reset() {
    proformes_.clear();
    active_ids_.clear();
    concept_index_.clear();
    seed_base_proformes();
}

std::vector<Proforme> ProformeRegistry::regional_proformes(const std::string& region) {
    const std::string key = lowercase(region);
    if (key == "france") {
        return {
            make_regional("region-france-vehicle", "Vehicle (France)", "vehicle-handshape",
                          "vehicle", {"vehicle", "transport", "car"}, "france"),
            make_regional("region-france-person", "Person (France)", "person-handshape",
                          "person", {"person", "individual", "human"}, "france"),
        };
    }
    if (key == "quebec") {
        return {
            make_regional("region-quebec-vehicle", "Vehicle (Quebec)", "vehicle-handshape-quebec",
                          "vehicle", {"vehicle", "transport", "car"}, "quebec"),
        };
    }
    return {};
}

void ProformeRegistry::seed_base_proformes() {
    Proforme index;
    index.id = "base-index-pointing";
    index.name = "Index pointing";
    index.handshape = make_handshape("index-pointing", {0.0, 1.0, 1.0, 1.0, 0.5},
                                     {0.0, 0.0, 0.0, 0.0, 0.5}, 0.7);
    index.orientation = HandOrientation{"down", "forward"};
    index.represents = "pointing-reference";
    index.associated_concepts = {"pointing", "reference", "direction"};
    index.default_position = Point3D(0.2, 0.1, 0.3);

    Proforme flat;
    flat.id = "base-flat-hand";
    flat.name = "Flat hand";
    flat.handshape = make_handshape("flat-hand", {0.0, 0.0, 0.0, 0.0, 0.0},
                                    {0.0, 0.0, 0.0, 0.0, 1.0}, 0.5);
    flat.orientation = HandOrientation{"down", "forward"};
    flat.represents = "surface";
    flat.associated_concepts = {"surface", "plane", "flat"};
    flat.default_position = Point3D(0.0, 0.0, 0.3);

    Proforme c_shape;
    c_shape.id = "base-c-handshape";
    c_shape.name = "C handshape";
    c_shape.handshape = make_handshape("c-handshape", {0.5, 0.5, 0.5, 0.5, 0.5},
                                       {0.0, 0.0, 0.0, 0.0, 0.8}, 0.6);
    c_shape.orientation = HandOrientation{"side", "forward"};
    c_shape.represents = "cylindrical-object";
    c_shape.associated_concepts = {"cylinder", "round object", "circle"};
    c_shape.default_position = Point3D(0.1, 0.0, 0.3);

    for (const Proforme* p : {&index, &flat, &c_shape}) {
        add_proforme(*p);
        active_ids_.insert(p->id);
    }
}

void ProformeRegistry::adapt_to_formality(double formality) {
    const double f = clamp_unit(formality);
    for (const auto& id : active_ids_) {
        auto it = proformes_.find(id);
        if (it == proformes_.end()) continue;

        Proforme& p = it->second;
        p.handshape.tension = clamp_unit(0.5 + f * 0.3);

        // Position is always derived from default_position
        if (!p.default_position && p.position) {
            p.default_position = p.position;
        }
        if (p.default_position) {
            p.position = adjust_position_for_formality(*p.default_position, f);
        }
    }
}

} // namespace signspace
