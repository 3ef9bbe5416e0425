#pragma once

#include "signspace/proforme.hpp"
#include "signspace/types.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace signspace {

/**
 * Proforme Registry - catalog of hand-configuration primitives.
 *
 * Keeps a concept -> proforme-id index (lower-cased) next to the catalog and
 * tracks which proformes are active for the current cultural context.
 * Single-writer state: the owner serializes access.
 */
class ProformeRegistry {
public:
    static constexpr const char* BASE_PREFIX = "base-";

    ProformeRegistry();

    // Clear the active set, reactivate base proformes, load regional ones and
    // adapt tension/position to the context formality
    void prepare_for_context(const CulturalContext& context);

    // Fails without side effects on duplicate id
    bool add_proforme(const Proforme& proforme);
    bool remove_proforme(const std::string& id);

    const Proforme* get_proforme(const std::string& id) const;
    bool is_active(const std::string& id) const { return active_ids_.count(id) != 0; }

    // Active proformes ordered by id
    std::vector<Proforme> active_proformes() const;

    // Case-insensitive lookup restricted to active proformes, ordered by id
    std::vector<Proforme> proformes_by_representation(const std::string& concept_name) const;

    // Drop everything and reseed the base set
    void reset();

    size_t size() const noexcept { return proformes_.size(); }
    size_t active_count() const noexcept { return active_ids_.size(); }

    // Proformes a region contributes on top of the base set
    static std::vector<Proforme> regional_proformes(const std::string& region);

private:
    void seed_base_proformes();
    void adapt_to_formality(double formality);

    std::unordered_map<std::string, Proforme> proformes_;
    std::unordered_set<std::string> active_ids_;
    std::unordered_map<std::string, std::unordered_set<std::string>> concept_index_;
};

// Formality pull toward the body: x *= (1 - f*0.2), y += f*0.02, z -= f*0.01
Point3D adjust_position_for_formality(const Point3D& position, double formality) noexcept;

} // namespace signspace
