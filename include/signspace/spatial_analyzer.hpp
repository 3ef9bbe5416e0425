#pragma once

#include "signspace/analysis.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace signspace {

struct AnalyzerConfig {
    double confidence_threshold = 0.7;
    double grid_step = 0.5;                 // spacing between text tokens
    double grid_row_limit = 3.0;            // wrap to next row past this x
    double sequence_strength = 0.8;
    double default_relation_strength = 0.7;
    double processing_time_limit_ms = 5000.0;
    size_t suggestion_component_limit = 20;
    double low_coherence_threshold = 0.5;
    std::string model_version = "1.0.0";
};

/**
 * Component Extractor - raw input to typed components and relations.
 *
 * Text: whitespace tokens, keyword classification, grid positions and a
 * temporal relation between consecutive tokens. Structured: records mapped
 * one-to-one, unknown labels defaulting to zone / semantic.
 */
class ComponentExtractor {
public:
    explicit ComponentExtractor(const AnalyzerConfig& config) : config_(config) {}

    void extract_text(const std::string& text,
                      std::vector<SpatialComponent>& components,
                      std::vector<SpatialRelation>& relations) const;

    void extract_structured(const StructuredInput& input,
                            std::vector<SpatialComponent>& components,
                            std::vector<SpatialRelation>& relations) const;

    static ComponentKind classify_token(const std::string& token);
    static std::vector<std::string> tokenize(const std::string& text);
    static Point3D extract_position(const InputRecord& record);

private:
    const AnalyzerConfig& config_;
};

/**
 * Spatial Analyzer - runs extraction and computes graph and metrics.
 */
class SpatialAnalyzer {
public:
    explicit SpatialAnalyzer(AnalyzerConfig config = {});

    SpatialAnalysis analyze(const AnalyzerInput& input) const;

    // Convenience for the text path
    SpatialAnalysis analyze_text(const std::string& text) const {
        return analyze(AnalyzerInput::from_text(text));
    }

    static SpatialGraph build_graph(const std::vector<SpatialComponent>& components,
                                    const std::vector<SpatialRelation>& relations);

    // 0.4 * type diversity + 0.6 * relation density, capped at 1
    static double complexity_score(const std::vector<SpatialComponent>& components,
                                   const std::vector<SpatialRelation>& relations);

    // Fraction of relations with both endpoints resolved; 1 without relations,
    // 0 without components
    static double coherence_score(const std::vector<SpatialComponent>& components,
                                  const std::vector<SpatialRelation>& relations);

    const AnalyzerConfig& config() const noexcept { return config_; }

private:
    AnalysisMetadata generate_metadata(const std::vector<SpatialComponent>& components,
                                       const std::vector<SpatialRelation>& relations,
                                       double processing_time_ms) const;

    AnalyzerConfig config_;
    ComponentExtractor extractor_;
    mutable std::atomic<uint64_t> analysis_counter_{0};
};

} // namespace signspace
