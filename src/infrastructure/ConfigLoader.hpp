/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine settings and schema descriptors.
 *
 * Keeps file handling and JSON parsing out of the domain and application layers.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/AnnotationSchema.hpp"
#include "domain/EngineConfig.hpp"

namespace annobench::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads engine settings from a JSON file.
     * @param path Path of the settings file.
     * @return The configuration, or nullopt if the file is missing or malformed.
     */
    static std::optional<domain::EngineConfig> LoadEngineConfig(const std::string& path);

    /**
     * @brief Writes engine settings, preserving unrelated keys already present in the file.
     * @return false if the file could not be written.
     */
    static bool SaveEngineConfig(const std::string& path, const domain::EngineConfig& config);

    /**
     * @brief Reads a schema descriptor ({"name", "fields", "roles"}).
     * @return The schema, or nullopt if the file is missing or the descriptor is invalid.
     */
    static std::optional<domain::AnnotationSchema> LoadSchema(const std::string& path);

    static bool SaveSchema(const std::string& path, const domain::AnnotationSchema& schema);
};

} // namespace annobench::infrastructure
