#pragma once

#include "signspace/logging.hpp"
#include "signspace/multi_level_cache.hpp"
#include "signspace/spatial_analyzer.hpp"
#include "signspace/spatial_validator.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace signspace {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env();
    // Key=value lines; '#' and ';' start comments; whitespace trimmed
    void load_from_file(const std::string& filename);
    void set_if_env(const std::string& key, const char* env_var);
    bool validate();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Environment variable prefix: cache.l1.max_size <- SIGNSPACE_CACHE_L1_MAX_SIZE
inline constexpr const char* ENV_PREFIX = "SIGNSPACE_";

// Apply log level and output from the loaded configuration
bool init_config(const std::string& config_file = "signspace.env");

CacheConfig cache_config_from(const Config& config);
AnalyzerConfig analyzer_config_from(const Config& config);
double validation_threshold_from(const Config& config);

EvictionPolicy parse_eviction_policy(const std::string& name, EvictionPolicy fallback) noexcept;
PreloadStrategy parse_preload_strategy(const std::string& name, PreloadStrategy fallback) noexcept;

} // namespace signspace
