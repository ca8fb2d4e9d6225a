/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

#include "infrastructure/AnnotationJson.hpp"

namespace annobench::infrastructure {

namespace {

std::optional<nlohmann::json> ReadJson(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream f(path);
    nlohmann::json j;
    f >> j;
    return j;
}

bool WriteJson(const std::filesystem::path& path, const nlohmann::json& j) {
    std::ofstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << path.string() << " for writing." << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace

std::optional<domain::EngineConfig> ConfigLoader::LoadEngineConfig(const std::string& path) {
    try {
        auto j = ReadJson(path);
        if (!j) return std::nullopt;
        return AnnotationJson::ConfigFromJson(*j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool ConfigLoader::SaveEngineConfig(const std::string& path, const domain::EngineConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Keep keys written by other tools
    try {
        if (auto existing = ReadJson(path); existing && existing->is_object()) {
            j = *existing;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring unreadable " << path << ": " << e.what() << std::endl;
    }

    j.update(AnnotationJson::ConfigToJson(config));

    try {
        return WriteJson(path, j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
    }
    return false;
}

std::optional<domain::AnnotationSchema> ConfigLoader::LoadSchema(const std::string& path) {
    try {
        auto j = ReadJson(path);
        if (!j) {
            std::cerr << "[ConfigLoader] Schema file not found: " << path << std::endl;
            return std::nullopt;
        }
        return AnnotationJson::SchemaFromJson(*j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading schema " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool ConfigLoader::SaveSchema(const std::string& path, const domain::AnnotationSchema& schema) {
    try {
        return WriteJson(path, AnnotationJson::SchemaToJson(schema));
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing schema " << path << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace annobench::infrastructure
