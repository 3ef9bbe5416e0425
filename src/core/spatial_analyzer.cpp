#include "signspace/spatial_analyzer.hpp"
#include "signspace/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <sstream>
#include <unordered_set>

namespace signspace {

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) return true;
    }
    return false;
}

double coordinate(const FieldMap& fields, const char* axis) {
    auto it = fields.find(axis);
    if (it == fields.end()) return 0.0;
    const auto* value = std::get_if<double>(&it->second);
    return value ? *value : 0.0;
}

} // anonymous namespace

// =============================================================================
// Component extraction
// =============================================================================

std::vector<std::string> ComponentExtractor::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

ComponentKind ComponentExtractor::classify_token(const std::string& token) {
    const std::string lower = lowercase(token);
    if (contains_any(lower, {"point", "montre", "show"})) return ComponentKind::Pointing;
    if (contains_any(lower, {"regard", "voir", "look", "gaze"})) return ComponentKind::Gaze;
    if (contains_any(lower, {"mouvement", "move"})) return ComponentKind::Movement;
    return ComponentKind::Zone;
}

Point3D ComponentExtractor::extract_position(const InputRecord& record) {
    const FieldMap& source = record.position ? *record.position : record.fields;
    return Point3D(coordinate(source, "x"), coordinate(source, "y"), coordinate(source, "z"));
}

void ComponentExtractor::extract_text(const std::string& text,
                                      std::vector<SpatialComponent>& components,
                                      std::vector<SpatialRelation>& relations) const {
    const auto tokens = tokenize(text);
    Point3D cursor = Point3D::Zero();

    for (size_t i = 0; i < tokens.size(); ++i) {
        SpatialComponent component;
        component.id = "comp_" + std::to_string(i);
        component.kind = classify_token(tokens[i]);
        component.position = cursor;
        component.properties["word"] = tokens[i];
        component.properties["index"] = std::to_string(i);
        component.properties["extracted_from"] = "text";
        components.push_back(std::move(component));

        cursor.x() += config_.grid_step;
        if (cursor.x() > config_.grid_row_limit) {
            cursor.x() = 0.0;
            cursor.y() -= config_.grid_step;
        }

        if (i + 1 < tokens.size()) {
            SpatialRelation relation;
            relation.id = "rel_" + std::to_string(i);
            relation.kind = RelationKind::Temporal;
            relation.source_id = "comp_" + std::to_string(i);
            relation.target_id = "comp_" + std::to_string(i + 1);
            relation.strength = config_.sequence_strength;
            relation.detail = SequenceDetail{i};
            relation.extensions["extracted_from"] = "text";
            relations.push_back(std::move(relation));
        }
    }
}

void ComponentExtractor::extract_structured(const StructuredInput& input,
                                            std::vector<SpatialComponent>& components,
                                            std::vector<SpatialRelation>& relations) const {
    for (size_t i = 0; i < input.components.size(); ++i) {
        const InputRecord& record = input.components[i];

        SpatialComponent component;
        component.id = record.text("id").value_or("comp_" + std::to_string(i));
        component.kind = parse_component_kind(record.text("type").value_or("zone"));
        component.position = extract_position(record);
        for (const auto& [key, value] : record.fields) {
            component.properties[key] = field_to_string(value);
        }
        component.properties["extracted_from"] = "structured";
        components.push_back(std::move(component));
    }

    for (size_t i = 0; i < input.relations.size(); ++i) {
        const InputRecord& record = input.relations[i];

        SpatialRelation relation;
        relation.id = record.text("id").value_or("rel_" + std::to_string(i));
        relation.kind = parse_relation_kind(record.text("type").value_or("semantic"));
        relation.source_id = record.text("source").value_or("");
        relation.target_id = record.text("target").value_or("");
        relation.strength = clamp_unit(record.number("strength").value_or(config_.default_relation_strength));
        for (const auto& [key, value] : record.fields) {
            relation.extensions[key] = field_to_string(value);
        }
        relation.extensions["extracted_from"] = "structured";
        relations.push_back(std::move(relation));
    }
}

// =============================================================================
// Analysis
// =============================================================================

SpatialAnalyzer::SpatialAnalyzer(AnalyzerConfig config)
    : config_(std::move(config))
    , extractor_(config_) {}

SpatialAnalysis SpatialAnalyzer::analyze(const AnalyzerInput& input) const {
    const auto start = std::chrono::steady_clock::now();

    SpatialAnalysis analysis;
    if (const auto* text = std::get_if<std::string>(&input.data)) {
        extractor_.extract_text(*text, analysis.components, analysis.relations);
    } else {
        extractor_.extract_structured(std::get<StructuredInput>(input.data),
                                      analysis.components, analysis.relations);
    }

    analysis.graph = build_graph(analysis.components, analysis.relations);

    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    analysis.metadata = generate_metadata(analysis.components, analysis.relations, elapsed_ms);
    analysis.id = "analysis_" + std::to_string(++analysis_counter_);

    LOG_DEBUG("Analysis ", analysis.id, ": ", analysis.components.size(), " components, ",
              analysis.relations.size(), " relations");
    return analysis;
}

SpatialGraph SpatialAnalyzer::build_graph(const std::vector<SpatialComponent>& components,
                                          const std::vector<SpatialRelation>& relations) {
    SpatialGraph graph;
    graph.nodes = components;
    graph.edges = relations;
    graph.node_count = components.size();
    graph.edge_count = relations.size();

    const double n = static_cast<double>(components.size());
    graph.density = components.size() >= 2 ? static_cast<double>(relations.size()) / (n * (n - 1.0)) : 0.0;
    return graph;
}

double SpatialAnalyzer::complexity_score(const std::vector<SpatialComponent>& components,
                                         const std::vector<SpatialRelation>& relations) {
    if (components.empty()) return 0.0;

    std::set<ComponentKind> kinds;
    for (const auto& c : components) kinds.insert(c.kind);
    const double diversity = static_cast<double>(kinds.size()) / static_cast<double>(COMPONENT_KIND_COUNT);

    const double n = static_cast<double>(components.size());
    const double density = components.size() >= 2
        ? static_cast<double>(relations.size()) / (n * (n - 1.0) / 2.0)
        : 0.0;

    return std::min(1.0, 0.4 * diversity + 0.6 * density);
}

double SpatialAnalyzer::coherence_score(const std::vector<SpatialComponent>& components,
                                        const std::vector<SpatialRelation>& relations) {
    if (components.empty()) return 0.0;
    if (relations.empty()) return 1.0;

    std::unordered_set<std::string> ids;
    for (const auto& c : components) ids.insert(c.id);

    size_t resolved = 0;
    for (const auto& r : relations) {
        if (ids.count(r.source_id) && ids.count(r.target_id)) ++resolved;
    }
    return static_cast<double>(resolved) / static_cast<double>(relations.size());
}

AnalysisMetadata SpatialAnalyzer::generate_metadata(const std::vector<SpatialComponent>& components,
                                                    const std::vector<SpatialRelation>& relations,
                                                    double processing_time_ms) const {
    AnalysisMetadata metadata;
    metadata.processing_time_ms = processing_time_ms;
    metadata.model_version = config_.model_version;
    metadata.statistics.component_count = components.size();
    metadata.statistics.relation_count = relations.size();
    metadata.statistics.complexity_score = complexity_score(components, relations);
    metadata.statistics.coherence_score = coherence_score(components, relations);

    if (processing_time_ms > config_.processing_time_limit_ms) {
        std::ostringstream oss;
        oss << "Processing time (" << processing_time_ms << "ms) exceeded limit ("
            << config_.processing_time_limit_ms << "ms)";
        metadata.warnings.push_back(oss.str());
    }
    if (components.empty()) {
        metadata.warnings.push_back("No components were extracted from the input");
    }

    if (metadata.statistics.coherence_score < config_.low_coherence_threshold) {
        metadata.suggestions.push_back("Consider reorganizing spatial components for better coherence");
    }
    if (components.size() > config_.suggestion_component_limit) {
        metadata.suggestions.push_back("Consider simplifying the spatial structure: many components reduce clarity");
    }

    metadata.confidence_score = components.empty() ? 0.1 : 0.8;

    for (const auto& warning : metadata.warnings) {
        LOG_WARN("Analysis warning: ", warning);
    }
    return metadata;
}

} // namespace signspace
