#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"

#ifndef IPASEG_DEFAULT_SYMBOL_TABLE
#define IPASEG_DEFAULT_SYMBOL_TABLE "data/ipa_symbol_table.csv"
#endif

namespace ipaseg {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            load_from_env();

            if (!config_file.empty()) {
                if (!std::filesystem::exists(config_file)) {
                    throw IOError("Config file not found: " + config_file, __func__);
                }
                load_from_file(config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t consumed = 0;
                int parsed = std::stoi(it->second, &consumed);
                if (consumed != it->second.size()) {
                    throw std::invalid_argument(it->second);
                }
                return parsed;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    // Print current configuration (for debugging)
    void print() const {
        std::vector<std::pair<std::string, std::string>> entries;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries.assign(values_.begin(), values_.end());
        }
        std::sort(entries.begin(), entries.end());

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : entries) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    bool validate() const {
        bool valid = true;

        try {
            parse_log_level(get<std::string>("log.level", "warn"));
        } catch (const InvalidArgumentError& e) {
            LOG_ERROR(e.message());
            valid = false;
        }

        if (get<int>("batch.threads", 0) < 0) {
            LOG_ERROR("Invalid batch thread count: ", get<std::string>("batch.threads"));
            valid = false;
        }

        if (get<std::string>("symbol_table.path").empty()) {
            LOG_ERROR("Symbol table path not configured");
            valid = false;
        }

        return valid;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("symbol_table.path", "IPASEG_SYMBOL_TABLE", IPASEG_DEFAULT_SYMBOL_TABLE);

        set_if_env("log.level", "IPASEG_LOG_LEVEL", "warn");
        set_if_env("log.file", "IPASEG_LOG_FILE", "");

        set_if_env("batch.threads", "IPASEG_THREADS", "0");  // 0 = auto-detect
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw IOError("Could not open config file: " + filename, __func__);
        }

        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);

            key.erase(key.begin(), std::find_if(key.begin(), key.end(), not_space));
            key.erase(std::find_if(key.rbegin(), key.rend(), not_space).base(), key.end());

            value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
            value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration and apply logging settings
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "warn")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

} // namespace ipaseg
