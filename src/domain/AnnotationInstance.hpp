/**
 * @file AnnotationInstance.hpp
 * @brief Domain entity representing one structured fact row (e.g. a gene/drug/phenotype assertion).
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/FieldValue.hpp"

namespace annobench::domain {

/**
 * @class AnnotationInstance
 * @brief Ordered mapping from field name to value. Has no identity beyond its content.
 *
 * A field that was never set reads as absent, so callers can score a partial record
 * against a full schema without pre-filling it.
 */
class AnnotationInstance {
public:
    using Entry = std::pair<std::string, FieldValue>;

    AnnotationInstance() = default;

    AnnotationInstance(std::initializer_list<Entry> entries) {
        for (const auto& entry : entries) {
            set(entry.first, entry.second);
        }
    }

    /** @brief Sets a field, keeping the position of an existing key. */
    void set(const std::string& field, FieldValue value) {
        for (auto& entry : m_entries) {
            if (entry.first == field) {
                entry.second = std::move(value);
                return;
            }
        }
        m_entries.emplace_back(field, std::move(value));
    }

    /** @brief Returns the value of a field, or an absent value if the key is unknown. */
    const FieldValue& get(const std::string& field) const {
        for (const auto& entry : m_entries) {
            if (entry.first == field) return entry.second;
        }
        return s_absent;
    }

    bool contains(const std::string& field) const {
        for (const auto& entry : m_entries) {
            if (entry.first == field) return true;
        }
        return false;
    }

    const std::vector<Entry>& entries() const { return m_entries; }
    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }

    bool operator==(const AnnotationInstance& other) const { return m_entries == other.m_entries; }

private:
    std::vector<Entry> m_entries;
    inline static const FieldValue s_absent{};
};

} // namespace annobench::domain
