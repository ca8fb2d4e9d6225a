/**
 * @file FieldValue.hpp
 * @brief Value Object holding one annotation cell: text, number or nothing.
 */

#pragma once

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <variant>

namespace annobench::domain {

/**
 * @class FieldValue
 * @brief A single field value as extracted from an article or a ground-truth table.
 *
 * Invariant: a string value is never blank. Blank strings collapse to the absent state
 * at construction, so evaluators only need to test isAbsent().
 */
class FieldValue {
public:
    FieldValue() = default;

    FieldValue(std::string text) {
        if (text.find_first_not_of(" \t\r\n") != std::string::npos) {
            m_value = std::move(text);
        }
    }

    FieldValue(const char* text) : FieldValue(std::string(text ? text : "")) {}

    FieldValue(double number) {
        if (!std::isnan(number)) {
            m_value = number;
        }
    }

    FieldValue(int number) : FieldValue(static_cast<double>(number)) {}

    /** @brief Explicitly absent value (null in JSON). */
    static FieldValue Absent() { return FieldValue(); }

    bool isAbsent() const { return std::holds_alternative<std::monostate>(m_value); }
    bool isNumber() const { return std::holds_alternative<double>(m_value); }
    bool isText() const { return std::holds_alternative<std::string>(m_value); }

    /** @brief Returns the numeric payload if the value was stored as a number. */
    std::optional<double> asNumber() const {
        if (const auto* n = std::get_if<double>(&m_value)) return *n;
        return std::nullopt;
    }

    /**
     * @brief Textual rendering used by every string-based evaluator.
     * Numbers use up to 15 significant digits ("1" for 1.0, "0.05" for 0.05).
     */
    std::string toString() const {
        if (const auto* s = std::get_if<std::string>(&m_value)) return *s;
        if (const auto* n = std::get_if<double>(&m_value)) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", *n);
            return buf;
        }
        return {};
    }

    bool operator==(const FieldValue& other) const { return m_value == other.m_value; }
    bool operator!=(const FieldValue& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, std::string, double> m_value;
};

} // namespace annobench::domain
