// =============================================================================
// signspace CLI - Signing Space Command-Line Interface
// =============================================================================
//
// Usage:
//   signspace [global options] <command> [options]
//
// Commands:
//   generate    Generate a spatial structure for a cultural context
//   analyze     Extract spatial components and relations from text
//   validate    Generate a structure, check its integrity and coherence scores
//   config      Show the effective configuration
//   version     Show version information
//
// Examples:
//   signspace generate --region france --formality 0.8 --tag educational
//   signspace generate --tag custom --custom abstract-reasoning --param hasContainers=true
//   signspace analyze "regarde la personne montre la maison"
//   signspace validate --threshold 0.9
//
// =============================================================================

#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "signspace/config.hpp"
#include "signspace/error.hpp"
#include "signspace/logging.hpp"
#include "signspace/structure_manager.hpp"

namespace signspace::cli {
    int cmd_generate(int argc, char* argv[]);
    int cmd_analyze(int argc, char* argv[]);
    int cmd_validate(int argc, char* argv[]);
    int cmd_config(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define SIGNSPACE_VERSION_MAJOR 1
#define SIGNSPACE_VERSION_MINOR 0
#define SIGNSPACE_VERSION_PATCH 0
#define SIGNSPACE_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"generate", "Generate a spatial structure for a cultural context", signspace::cli::cmd_generate},
    {"analyze",  "Extract spatial components and relations from text", signspace::cli::cmd_analyze},
    {"validate", "Generate a structure, check its integrity and coherence scores", signspace::cli::cmd_validate},
    {"config",   "Show the effective configuration", signspace::cli::cmd_config},
    {"version",  "Show version information", signspace::cli::cmd_version},
    {"help",     "Show this help message", signspace::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "signspace.env";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

using namespace signspace;

std::shared_ptr<SpatialStructureManager> make_manager(double threshold) {
    const Config& config = Config::getInstance();
    auto cache = std::make_shared<StructureCache>(cache_config_from(config));
    return std::make_shared<SpatialStructureManager>(cache, analyzer_config_from(config), threshold);
}

// Parses --region/--formality/--tag/--custom/--dialect/--param; returns false on a bad value
bool parse_context_option(int argc, char* argv[], int& i, CulturalContext& context) {
    std::string arg = argv[i];

    if (arg == "--region" && i + 1 < argc) {
        context.region = argv[++i];
    } else if (arg == "--formality" && i + 1 < argc) {
        try {
            context.formality_level = std::stod(argv[++i]);
        } catch (const std::exception&) {
            std::cerr << "Invalid formality: " << argv[i] << "\n";
            return false;
        }
    } else if (arg == "--tag" && i + 1 < argc) {
        auto tag = parse_context_tag(argv[++i]);
        if (!tag) {
            std::cerr << "Unknown context tag: " << argv[i] << "\n";
            return false;
        }
        context.tag = *tag;
    } else if (arg == "--custom" && i + 1 < argc) {
        context.tag = ContextTag::Custom;
        context.custom_tag = argv[++i];
    } else if (arg == "--dialect" && i + 1 < argc) {
        context.dialect = argv[++i];
    } else if (arg == "--param" && i + 1 < argc) {
        std::string pair = argv[++i];
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Expected key=value for --param, got: " << pair << "\n";
            return false;
        }
        context.parameters[pair.substr(0, eq)] = pair.substr(eq + 1);
    } else {
        std::cerr << "Unknown option: " << arg << "\n";
        return false;
    }
    return true;
}

void print_point(const Point3D& p) {
    std::cout << "(" << p.x() << ", " << p.y() << ", " << p.z() << ")";
}

void print_structure(const SpatialStructure& structure) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Structure " << structure.id << " (" << structure.metadata.context.region << ", "
              << structure.metadata.context.tag_label() << ", formality "
              << structure.metadata.context.formality() << ")\n";

    std::cout << "\nZones (" << structure.zones.size() << "):\n";
    for (const auto& zone : structure.zones) {
        std::cout << "  " << std::left << std::setw(20) << zone.id << std::right
                  << zone_kind_name(zone.kind) << " center ";
        print_point(zone.area.center);
        std::cout << " size " << zone.area.width << "x" << zone.area.height << "x" << zone.area.depth
                  << " priority " << zone.priority << "\n";
    }

    if (g_options.verbose) {
        std::cout << "\nProformes (" << structure.proformes.size() << "):\n";
        for (const auto& proforme : structure.proformes) {
            std::cout << "  " << std::left << std::setw(28) << proforme.id << std::right
                      << proforme.represents << " tension " << proforme.handshape.tension << "\n";
        }

        std::cout << "\nComponents (" << structure.components.size() << "):\n";
        for (const auto& component : structure.components) {
            std::cout << "  " << std::left << std::setw(28) << component.id << std::right
                      << component_kind_name(component.kind) << " ";
            print_point(component.position);
            std::cout << "\n";
        }

        std::cout << "\nRelations (" << structure.relations.size() << "):\n";
        for (const auto& relation : structure.relations) {
            std::cout << "  " << relation_kind_name(relation.kind) << " " << relation.source_id
                      << " -> " << relation.target_id << " (" << relation.strength << ")\n";
        }
    } else {
        std::cout << "Proformes: " << structure.proformes.size() << "\n";
        std::cout << "Components: " << structure.components.size() << "\n";
        std::cout << "Relations: " << structure.relations.size() << "\n";
    }

    std::cout << "\nCoherence: " << structure.metadata.coherence_score << "\n";
    std::cout << "Complexity: " << structure.metadata.complexity_score << "\n";
    std::cout << "Optimization: " << structure.metadata.optimization_level << "\n";
}

} // anonymous namespace

// =============================================================================
// Help Command
// =============================================================================

namespace signspace::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "signspace - Signing Space Structure Engine\n";
    std::cout << "Version " << SIGNSPACE_VERSION_STRING << "\n\n";
    std::cout << "Usage: signspace [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: signspace.env)\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "\nContext Options (generate, validate):\n";
    std::cout << "  --region <name>         Cultural region (default: france)\n";
    std::cout << "  --formality <0..1>      Formality level (default: 0.5)\n";
    std::cout << "  --tag <tag>             educational|conversational|narrative|technical|custom\n";
    std::cout << "  --custom <label>        Custom context tag (implies --tag custom)\n";
    std::cout << "  --dialect <name>        Dialect\n";
    std::cout << "  --param <key=value>     Context parameter (repeatable)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SIGNSPACE_LOG_LEVEL     debug|info|warn|error|fatal\n";
    std::cout << "  SIGNSPACE_<KEY>         Any configuration key, '.' replaced by '_'\n";
    std::cout << "\nExamples:\n";
    std::cout << "  signspace generate --region quebec --formality 0.9\n";
    std::cout << "  signspace analyze \"montre la maison\"\n";
    std::cout << "  signspace validate --threshold 0.9\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "signspace " << SIGNSPACE_VERSION_STRING << "\n";
    std::cout << "Analyzer model: " << AnalyzerConfig{}.model_version << "\n";
    return 0;
}

// =============================================================================
// Config Command
// =============================================================================

int cmd_config([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const Config& config = Config::getInstance();
    config.print();

    const CacheConfig cache = cache_config_from(config);
    for (auto level : {CacheLevel::L1, CacheLevel::L2, CacheLevel::Predictive}) {
        const TierConfig& tier = cache.tier(level);
        std::cout << cache_level_name(level) << ": max_size " << tier.max_size
                  << ", ttl " << tier.ttl.count() << " ms\n";
    }
    std::cout << "Validation threshold: " << validation_threshold_from(config) << "\n";
    return 0;
}

// =============================================================================
// Generate Command
// =============================================================================

int cmd_generate(int argc, char* argv[]) {
    CulturalContext context;
    for (int i = 0; i < argc; ++i) {
        if (!parse_context_option(argc, argv, i, context)) return 1;
    }

    try {
        auto manager = make_manager(validation_threshold_from(Config::getInstance()));
        auto structure = manager->generate_spatial_structure(context);
        print_structure(*structure);

        const auto report = manager->validate_spatial_structure(*structure);
        std::cout << "Integrity: " << (report.valid ? "ok" : "issues found")
                  << " (score " << report.score << ")\n";
        for (const auto& issue : report.issues) {
            std::cout << "  - " << issue << "\n";
        }
        return report.valid ? 0 : 2;
    } catch (const SignspaceException& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 1;
    }
}

// =============================================================================
// Analyze Command
// =============================================================================

int cmd_analyze(int argc, char* argv[]) {
    std::string text;
    for (int i = 0; i < argc; ++i) {
        if (!text.empty()) text += ' ';
        text += argv[i];
    }

    if (text.empty()) {
        std::cerr << "Usage: signspace analyze <text>\n";
        return 1;
    }

    auto manager = make_manager(validation_threshold_from(Config::getInstance()));
    auto analysis = manager->analyze_spatial_structure(AnalyzerInput::from_text(text));

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Analysis " << analysis->id << "\n";
    std::cout << "Components (" << analysis->components.size() << "):\n";
    for (const auto& component : analysis->components) {
        auto word = component.properties.find("word");
        std::cout << "  " << std::left << std::setw(10) << component.id << std::right
                  << std::setw(12) << component_kind_name(component.kind) << "  "
                  << (word != component.properties.end() ? word->second : "") << "\n";
    }
    std::cout << "Relations: " << analysis->relations.size() << "\n";
    std::cout << "Graph density: " << analysis->graph.density << "\n";
    std::cout << "Complexity: " << analysis->metadata.statistics.complexity_score << "\n";
    std::cout << "Coherence: " << analysis->metadata.statistics.coherence_score << "\n";
    std::cout << "Confidence: " << analysis->metadata.confidence_score << "\n";

    for (const auto& warning : analysis->metadata.warnings) {
        std::cout << "Warning: " << warning << "\n";
    }
    for (const auto& suggestion : analysis->metadata.suggestions) {
        std::cout << "Suggestion: " << suggestion << "\n";
    }
    return 0;
}

// =============================================================================
// Validate Command
// =============================================================================

int cmd_validate(int argc, char* argv[]) {
    CulturalContext context;
    double threshold = validation_threshold_from(Config::getInstance());

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--threshold" && i + 1 < argc) {
            try {
                threshold = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid threshold: " << argv[i] << "\n";
                return 1;
            }
        } else if (!parse_context_option(argc, argv, i, context)) {
            return 1;
        }
    }

    try {
        auto manager = make_manager(threshold);
        auto structure = manager->generate_spatial_structure(context);

        std::cout << std::fixed << std::setprecision(3);
        const auto report = manager->validate_spatial_structure(*structure);
        std::cout << "Integrity score: " << report.score << "\n";
        for (const auto& issue : report.issues) {
            std::cout << "  - " << issue << "\n";
        }
        if (!report.valid) {
            std::cerr << "Structure " << structure->id << " has " << report.issues.size() << " integrity issue(s)\n";
            return 2;
        }

        const auto scores = manager->validator().validate_structure(*structure->layout);
        for (const auto& [name, value] : scores.as_map()) {
            std::cout << std::left << std::setw(24) << name << std::right << value << "\n";
        }
        std::cout << "Structure passes threshold " << threshold << "\n";
        return 0;
    } catch (const ValidationError& e) {
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& [name, value] : e.scores()) {
            std::cout << std::left << std::setw(24) << name << std::right << value
                      << (value < e.threshold() ? "  below threshold" : "") << "\n";
        }
        std::cerr << "Validation failed: " << e.what() << "\n";
        return 2;
    } catch (const SignspaceException& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace signspace::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command; unknown options go to the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!signspace::init_config(g_options.config_file)) {
        std::cerr << "Invalid configuration in " << g_options.config_file << "\n";
        return 1;
    }
    if (g_options.verbose) signspace::set_log_level(signspace::LogLevel::DEBUG);
    if (g_options.quiet) signspace::set_log_level(signspace::LogLevel::ERROR);

    if (argc < 1) {
        signspace::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'signspace help' for usage.\n";
    return 1;
}
