#include "signspace/structure_manager.hpp"
#include "signspace/error.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <unordered_set>

namespace signspace {

namespace {

// Flattened record content for hashing; keys are ordered by FieldMap
void append_record(std::ostringstream& oss, const InputRecord& record) {
    oss << '{';
    for (const auto& [key, value] : record.fields) {
        oss << key << '=' << value.index() << ':' << field_to_string(value) << ';';
    }
    if (record.position) {
        oss << "position{";
        for (const auto& [key, value] : *record.position) {
            oss << key << '=' << field_to_string(value) << ';';
        }
        oss << '}';
    }
    oss << '}';
}

std::map<std::string, std::string> element_properties(const SpatialElement& element) {
    std::map<std::string, std::string> properties;
    properties["entity_kind"] = entity_kind_name(element.kind);
    properties["zone"] = element.zone_id;

    std::ostringstream importance;
    importance << element.importance_or_default();
    properties["importance"] = importance.str();

    std::visit([&](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, ActantProperties>) {
            properties["role"] = p.role;
        } else if constexpr (std::is_same_v<P, TimeMarkerProperties>) {
            properties["time_segment"] = p.time_segment;
        } else if constexpr (std::is_same_v<P, TopicMarkerProperties>) {
            properties["thematic_field"] = p.thematic_field;
            properties["emphasis"] = p.emphasis;
        } else if constexpr (std::is_same_v<P, ContainerProperties>) {
            properties["container_type"] = p.container_type;
        } else if constexpr (std::is_same_v<P, ConceptProperties>) {
            properties["concept_type"] = p.concept_type;
        }
    }, element.properties);

    if (element.proforme_id) {
        properties["proforme"] = *element.proforme_id;
    }
    return properties;
}

} // anonymous namespace

double zone_optimization_level(const std::vector<ReferenceZone>& zones) noexcept {
    if (zones.size() < 2) return 1.0;

    size_t pairs = 0;
    size_t clear = 0;
    for (size_t i = 0; i < zones.size(); ++i) {
        for (size_t j = i + 1; j < zones.size(); ++j) {
            ++pairs;
            if (!volumes_overlap(zones[i].area, zones[j].area)) ++clear;
        }
    }
    return static_cast<double>(clear) / static_cast<double>(pairs);
}

SpatialStructureManager::SpatialStructureManager(std::shared_ptr<StructureCache> cache,
                                                 AnalyzerConfig analyzer_config,
                                                 double validation_threshold)
    : cache_(std::move(cache))
    , zone_generator_(space_)
    , layout_generator_(space_, proformes_)
    , analyzer_(std::move(analyzer_config))
    , validator_(validation_threshold, &proformes_) {
    SIGNSPACE_CHECK_ARGUMENT(cache_ != nullptr, "Spatial structure manager requires a cache instance");
}

// =============================================================================
// Cache keys
// =============================================================================

std::string SpatialStructureManager::structure_cache_key(const CulturalContext& context) {
    std::ostringstream oss;
    // Full round-trip precision so nearby formality levels never share an entry
    oss << "structure_" << context.region << '_' << std::setprecision(17) << context.formality()
        << '_' << context.tag_label();
    if (!context.parameters.empty()) {
        oss << '_';
        for (const auto& [key, value] : context.parameters) {
            oss << key << '=' << value << ',';
        }
    }
    return oss.str();
}

std::string SpatialStructureManager::analysis_cache_key(const AnalyzerInput& input) {
    std::ostringstream content;
    content << "type:" << input.type << '|';
    if (const auto* text = std::get_if<std::string>(&input.data)) {
        content << "text:" << *text;
    } else {
        const auto& records = std::get<StructuredInput>(input.data);
        content << "components:";
        for (const auto& record : records.components) append_record(content, record);
        content << "relations:";
        for (const auto& record : records.relations) append_record(content, record);
    }

    std::ostringstream key;
    key << "analysis_" << std::hex << std::hash<std::string>{}(content.str());
    return key.str();
}

// =============================================================================
// Generation
// =============================================================================

std::shared_ptr<const SpatialStructure>
SpatialStructureManager::generate_spatial_structure(const CulturalContext& context) {
    const std::string key = structure_cache_key(context);

    auto lookup = [&]() -> std::shared_ptr<const SpatialStructure> {
        auto cached = cache_->get(key);
        if (!cached) return nullptr;
        const auto* structure = std::get_if<SpatialStructure>(cached.get());
        if (!structure) return nullptr;
        return std::shared_ptr<const SpatialStructure>(cached, structure);
    };

    if (auto hit = lookup()) {
        LOG_DEBUG("Structure cache hit for ", key);
        return hit;
    }

    std::lock_guard<std::mutex> lock(generation_mutex_);
    if (auto hit = lookup()) {
        return hit;
    }

    auto value = std::make_shared<const StructureCacheValue>(build_structure(context));
    cache_->set(key, value, CacheLevel::L2);

    LOG_INFO("Generated spatial structure ", std::get<SpatialStructure>(*value).id, " for ", key);
    return std::shared_ptr<const SpatialStructure>(value, &std::get<SpatialStructure>(*value));
}

SpatialStructure SpatialStructureManager::build_structure(const CulturalContext& context) {
    SpatialStructure structure;
    SpatialLayout layout;

    try {
        space_.initialize(context);
        proformes_.prepare_for_context(context);
        structure.zones = zone_generator_.generate_zones(context);
        layout = layout_generator_.generate_layout(structure.zones, &context);
    } catch (const LayoutError&) {
        throw;
    } catch (const StructureGenerationError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Structure generation failed for region '", context.region, "': ", e.what());
        throw StructureGenerationError(std::string("Failed to generate spatial structure: ") + e.what(),
                                       ErrorCode::GENERATION_FAILED,
                                       {{"region", context.region},
                                        {"context", context.tag_label()},
                                        {"cause", e.what()}},
                                       __func__);
    }

    structure.id = "structure_" + std::to_string(++structure_counter_);
    structure.proformes = proformes_.active_proformes();
    structure.relations = layout.relations;

    structure.components.reserve(layout.elements.size());
    for (const auto& [id, element] : layout.elements) {
        SpatialComponent component;
        component.id = id;
        component.kind = element.kind == EntityKind::Entity ? ComponentKind::Proforme : ComponentKind::Zone;
        component.position = element.position;
        component.properties = element_properties(element);
        structure.components.push_back(std::move(component));
    }

    structure.metadata.created_at = std::chrono::system_clock::now();
    structure.metadata.context = context;
    structure.metadata.coherence_score = validator_.measure_coherence(layout);
    structure.metadata.complexity_score = SpatialAnalyzer::complexity_score(structure.components, structure.relations);
    structure.metadata.optimization_level = zone_optimization_level(structure.zones);
    structure.metadata.element_count = layout.elements.size();
    structure.metadata.relation_count = layout.relations.size();

    structure.layout = std::make_shared<const SpatialLayout>(std::move(layout));
    return structure;
}

// =============================================================================
// Analysis
// =============================================================================

std::shared_ptr<const SpatialAnalysis>
SpatialStructureManager::analyze_spatial_structure(const AnalyzerInput& input) {
    const std::string key = analysis_cache_key(input);

    if (auto cached = cache_->get(key)) {
        if (const auto* analysis = std::get_if<SpatialAnalysis>(cached.get())) {
            LOG_DEBUG("Analysis cache hit for ", key);
            return std::shared_ptr<const SpatialAnalysis>(cached, analysis);
        }
    }

    auto value = std::make_shared<const StructureCacheValue>(analyzer_.analyze(input));
    cache_->set(key, value, CacheLevel::L2);
    return std::shared_ptr<const SpatialAnalysis>(value, &std::get<SpatialAnalysis>(*value));
}

// =============================================================================
// Self-validation
// =============================================================================

StructureValidationReport SpatialStructureManager::validate_spatial_structure(const SpatialStructure& structure) const {
    StructureValidationReport report;
    auto& issues = report.issues;

    auto label = [](const std::string& id, size_t index) {
        return id.empty() ? std::to_string(index) : id;
    };

    for (size_t i = 0; i < structure.zones.size(); ++i) {
        const auto& zone = structure.zones[i];
        if (zone.id.empty()) {
            issues.push_back("Zone at index " + std::to_string(i) + " has no id");
        }
        if (!is_finite(zone.area.center)) {
            issues.push_back("Zone \"" + label(zone.id, i) + "\" has no valid position");
        }
        if (!zone.area.has_positive_size()) {
            issues.push_back("Zone \"" + label(zone.id, i) + "\" has invalid size");
        }
    }
    for (size_t i = 0; i < structure.zones.size(); ++i) {
        for (size_t j = i + 1; j < structure.zones.size(); ++j) {
            if (volumes_overlap(structure.zones[i].area, structure.zones[j].area, SELF_CHECK_OVERLAP_FACTOR)) {
                issues.push_back("Zones \"" + structure.zones[i].id + "\" and \"" +
                                 structure.zones[j].id + "\" overlap significantly");
            }
        }
    }

    for (size_t i = 0; i < structure.proformes.size(); ++i) {
        const auto& proforme = structure.proformes[i];
        if (proforme.id.empty()) {
            issues.push_back("Proforme at index " + std::to_string(i) + " has no id");
        }
        if (proforme.name.empty()) {
            issues.push_back("Proforme \"" + label(proforme.id, i) + "\" has no name");
        }
        if (proforme.handshape.type.empty()) {
            issues.push_back("Proforme \"" + label(proforme.id, i) + "\" has no handshape");
        }
        if (!proforme.orientation.complete()) {
            issues.push_back("Proforme \"" + label(proforme.id, i) + "\" has incomplete orientation");
        }
    }

    std::unordered_set<std::string> component_ids;
    for (size_t i = 0; i < structure.components.size(); ++i) {
        const auto& component = structure.components[i];
        component_ids.insert(component.id);
        if (component.id.empty()) {
            issues.push_back("Component at index " + std::to_string(i) + " has no id");
        }
        if (component.kind == ComponentKind::Unknown) {
            issues.push_back("Component \"" + label(component.id, i) + "\" has no type");
        }
        if (component.properties.empty()) {
            issues.push_back("Component \"" + label(component.id, i) + "\" has no properties");
        }
    }

    for (size_t i = 0; i < structure.relations.size(); ++i) {
        const auto& relation = structure.relations[i];
        const std::string name = label(relation.id, i);
        if (relation.id.empty()) {
            issues.push_back("Relation at index " + std::to_string(i) + " has no id");
        }
        if (!component_ids.count(relation.source_id)) {
            issues.push_back("Relation \"" + name + "\" references non-existent source component \"" +
                             relation.source_id + "\"");
        }
        if (!component_ids.count(relation.target_id)) {
            issues.push_back("Relation \"" + name + "\" references non-existent target component \"" +
                             relation.target_id + "\"");
        }
        if (relation.kind == RelationKind::Unknown) {
            issues.push_back("Relation \"" + name + "\" has no type");
        }
        if (!(relation.strength >= 0.0 && relation.strength <= 1.0)) {
            issues.push_back("Relation \"" + name + "\" has invalid strength " +
                             std::to_string(relation.strength) + " (must be between 0 and 1)");
        }
    }

    const size_t checkable = structure.zones.size() + structure.proformes.size() +
                             structure.components.size() + structure.relations.size();
    report.valid = issues.empty();
    report.score = checkable > 0
        ? std::max(0.0, 1.0 - static_cast<double>(issues.size()) / static_cast<double>(checkable))
        : 1.0;

    if (!report.valid) {
        LOG_WARN("Structure ", structure.id, " has ", issues.size(), " integrity issue(s)");
    }
    return report;
}

// =============================================================================
// Deferred variants
// =============================================================================

std::future<std::shared_ptr<const SpatialStructure>>
SpatialStructureManager::generate_spatial_structure_async(CulturalContext context) {
    return std::async(std::launch::deferred, [this, context = std::move(context)]() {
        return generate_spatial_structure(context);
    });
}

std::future<std::shared_ptr<const SpatialAnalysis>>
SpatialStructureManager::analyze_spatial_structure_async(AnalyzerInput input) {
    return std::async(std::launch::deferred, [this, input = std::move(input)]() {
        return analyze_spatial_structure(input);
    });
}

} // namespace signspace
