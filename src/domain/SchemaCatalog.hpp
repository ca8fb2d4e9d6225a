/**
 * @file SchemaCatalog.hpp
 * @brief Built-in schema descriptors for the pharmacogenomic annotation families.
 */

#pragma once

#include <array>
#include <optional>
#include <string>

#include "domain/AnnotationSchema.hpp"

namespace annobench::domain {

/**
 * @class SchemaCatalog
 * @brief Factory for the stable annotation schemas (phenotype, drug, functional, study parameters).
 *
 * Each call builds a fresh descriptor; callers may copy and tweak them freely.
 */
class SchemaCatalog {
public:
    /** @brief Names accepted by ByName(). */
    static constexpr std::array<const char*, 4> Families = {
        "phenotype", "drug", "functional", "study_parameters"
    };

    static AnnotationSchema Phenotype();
    static AnnotationSchema Drug();
    static AnnotationSchema Functional();
    static AnnotationSchema StudyParameters();

    /**
     * @brief Looks up a built-in schema by family name.
     * @return std::nullopt for an unknown family.
     */
    static std::optional<AnnotationSchema> ByName(const std::string& family);
};

} // namespace annobench::domain
