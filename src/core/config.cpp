#include "signspace/config.hpp"

#include <cctype>
#include <fstream>

namespace signspace {

namespace {

// Keys that may be overridden from the environment
const char* const ENV_KEYS[] = {
    "log.level",
    "log.file",
    "cache.l1.max_size",
    "cache.l1.ttl_ms",
    "cache.l1.policy",
    "cache.l2.max_size",
    "cache.l2.ttl_ms",
    "cache.l2.policy",
    "cache.predictive.max_size",
    "cache.predictive.ttl_ms",
    "cache.predictive.policy",
    "cache.predictive.preload",
    "analyzer.time_limit_ms",
    "analyzer.confidence_threshold",
    "validator.threshold",
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// cache.l1.max_size -> SIGNSPACE_CACHE_L1_MAX_SIZE
std::string env_name(const std::string& key) {
    std::string name = ENV_PREFIX;
    for (char c : key) {
        name += c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
}

TierConfig tier_from(const Config& config, const std::string& prefix, const TierConfig& defaults) {
    TierConfig tier = defaults;
    tier.max_size = config.get<size_t>(prefix + ".max_size", defaults.max_size);
    tier.ttl = std::chrono::milliseconds(
        config.get<size_t>(prefix + ".ttl_ms", static_cast<size_t>(defaults.ttl.count())));
    tier.policy = parse_eviction_policy(config.get<std::string>(prefix + ".policy", ""), defaults.policy);
    return tier;
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

void Config::load_from_env() {
    for (const char* key : ENV_KEYS) {
        const std::string name = env_name(key);
        set_if_env(key, name.c_str());
    }
}

void Config::set_if_env(const std::string& key, const char* env_var) {
    const char* value = std::getenv(env_var);
    if (value) {
        values_[key] = value;
    }
}

void Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Could not open config file: ", filename);
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            LOG_WARN("Ignoring malformed config line: ", line);
            continue;
        }

        std::string key = line.substr(0, equals_pos);
        std::string value = line.substr(equals_pos + 1);
        trim(key);
        trim(value);

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    LOG_INFO("Loaded configuration from file: ", filename);
}

bool Config::validate() {
    bool valid = true;

    auto level_it = values_.find("log.level");
    if (level_it != values_.end()) {
        std::string level = to_lower(level_it->second);
        if (level == "warning") level = "warn";
        if (level != "debug" && level != "info" && level != "warn" &&
            level != "error" && level != "fatal") {
            LOG_WARN("Unknown log level '", level_it->second, "', defaulting to 'info'");
            level = "info";
        }
        level_it->second = level;
    }

    const double threshold = get_unlocked<double>("validator.threshold", SpatialValidator::DEFAULT_THRESHOLD);
    if (threshold < 0.0 || threshold > 1.0) {
        LOG_ERROR("Invalid validator threshold: ", threshold, " (must be between 0 and 1)");
        valid = false;
    }

    const double time_limit = get_unlocked<double>("analyzer.time_limit_ms", 5000.0);
    if (time_limit <= 0.0) {
        LOG_ERROR("Invalid analyzer time limit: ", time_limit);
        valid = false;
    }

    return valid;
}

bool init_config(const std::string& config_file) {
    Config& config = Config::getInstance();

    // Environment log level applies while the file is loaded
    if (const char* env_level = std::getenv("SIGNSPACE_LOG_LEVEL")) {
        set_log_level(parse_log_level(env_level));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    return true;
}

// =============================================================================
// Typed configuration
// =============================================================================

EvictionPolicy parse_eviction_policy(const std::string& name, EvictionPolicy fallback) noexcept {
    const std::string lower = to_lower(name);
    if (lower == "lru") return EvictionPolicy::LRU;
    if (lower == "lfu") return EvictionPolicy::LFU;
    if (lower == "fifo") return EvictionPolicy::FIFO;
    if (lower == "adaptive") return EvictionPolicy::ADAPTIVE;
    return fallback;
}

PreloadStrategy parse_preload_strategy(const std::string& name, PreloadStrategy fallback) noexcept {
    const std::string lower = to_lower(name);
    if (lower == "none") return PreloadStrategy::None;
    if (lower == "adjacent") return PreloadStrategy::Adjacent;
    if (lower == "pattern") return PreloadStrategy::Pattern;
    if (lower == "hybrid") return PreloadStrategy::Hybrid;
    return fallback;
}

CacheConfig cache_config_from(const Config& config) {
    const CacheConfig defaults;
    CacheConfig result;
    result.l1 = tier_from(config, "cache.l1", defaults.l1);
    result.l2 = tier_from(config, "cache.l2", defaults.l2);
    result.predictive = tier_from(config, "cache.predictive", defaults.predictive);
    result.preload = parse_preload_strategy(config.get<std::string>("cache.predictive.preload", ""), defaults.preload);
    return result;
}

AnalyzerConfig analyzer_config_from(const Config& config) {
    AnalyzerConfig result;
    result.processing_time_limit_ms = config.get<double>("analyzer.time_limit_ms", result.processing_time_limit_ms);
    result.confidence_threshold = config.get<double>("analyzer.confidence_threshold", result.confidence_threshold);
    return result;
}

double validation_threshold_from(const Config& config) {
    return config.get<double>("validator.threshold", SpatialValidator::DEFAULT_THRESHOLD);
}

} // namespace signspace
