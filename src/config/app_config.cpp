#include "app_config.hpp"

#include <fstream>
#include <stdexcept>

#include "utils/logger.hpp"

static void validate(const AppConfig& config) {
    if (config.relay.max_attempts < 1) {
        throw std::runtime_error("relay.max_attempts must be at least 1");
    }
    if (config.relay.base_delay_ms < 0 || config.relay.grace_ms < 0) {
        throw std::runtime_error("relay delays must not be negative");
    }
    if (config.auth.final_ttl_seconds <= 0 || config.auth.primary_default_ttl_seconds <= 0) {
        throw std::runtime_error("token lifetimes must be positive");
    }
    if (config.cache.file_name.empty()) {
        throw std::runtime_error("cache.file_name must not be empty");
    }
}

AppConfig loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LOG_DEBUG("Config file " + path.string() + " not found, using defaults");
        return AppConfig{};
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file for reading: " + path.string());
    }

    AppConfig config;
    try {
        nlohmann::json j;
        ifs >> j;
        config = j.get<AppConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    validate(config);
    LOG_DEBUG("Loaded config from " + path.string());
    return config;
}

void saveConfig(const std::filesystem::path& path, const AppConfig& config) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json j = config;
    std::ofstream  ofs(path);
    if (ofs.is_open()) {
        ofs << j.dump(4);
        ofs.close();
    } else {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
}
