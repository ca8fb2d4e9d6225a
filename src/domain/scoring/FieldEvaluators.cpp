/**
 * @file FieldEvaluators.cpp
 * @brief Implementation of the field similarity metrics.
 */

#include "domain/scoring/FieldEvaluators.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace annobench::domain::scoring {

namespace {

const std::unordered_set<std::string> kStopWords = {
    "is", "are", "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by"
};

// UTF-8 spellings of the inclusive comparison operators.
const std::string kLessEqual = "\xE2\x89\xA4";
const std::string kGreaterEqual = "\xE2\x89\xA5";

// Highest score two different alleles of one gene can reach through spelling similarity.
constexpr double kConflictingAlleleCap = 0.8;

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string Trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool StartsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) return false;
    }
    return true;
}

bool AllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Absence rule shared by every metric. Returns a score when at least one side is absent.
std::optional<double> AbsenceScore(bool predictedAbsent, bool expectedAbsent) {
    if (predictedAbsent && expectedAbsent) return 1.0;
    if (predictedAbsent || expectedAbsent) return 0.0;
    return std::nullopt;
}

struct Match {
    size_t a = 0;
    size_t b = 0;
    size_t size = 0;
};

// Longest common block of a[alo, ahi) and b[blo, bhi); earliest in a, then earliest in b.
Match FindLongestMatch(const std::string& a, const std::string& b,
                       const std::unordered_map<char, std::vector<size_t>>& b2j,
                       size_t alo, size_t ahi, size_t blo, size_t bhi) {
    Match best{alo, blo, 0};
    std::unordered_map<size_t, size_t> j2len;
    for (size_t i = alo; i < ahi; ++i) {
        std::unordered_map<size_t, size_t> next;
        auto it = b2j.find(a[i]);
        if (it != b2j.end()) {
            for (size_t j : it->second) {
                if (j < blo) continue;
                if (j >= bhi) break;
                size_t k = 1;
                if (j > 0) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end()) k = prev->second + 1;
                }
                next[j] = k;
                if (k > best.size) {
                    best = {i + 1 - k, j + 1 - k, k};
                }
            }
        }
        j2len.swap(next);
    }
    while (best.a > alo && best.b > blo && a[best.a - 1] == b[best.b - 1]) {
        --best.a;
        --best.b;
        ++best.size;
    }
    while (best.a + best.size < ahi && best.b + best.size < bhi && a[best.a + best.size] == b[best.b + best.size]) {
        ++best.size;
    }
    return best;
}

struct AlleleForm {
    std::string gene;
    std::string allele;
};

std::optional<AlleleForm> ParseAllele(const std::string& token) {
    const auto star = token.find('*');
    if (star != std::string::npos) {
        AlleleForm form{token.substr(0, star), token.substr(star + 1)};
        if (form.allele.empty()) return std::nullopt;
        return form;
    }
    if (AllDigits(token)) return AlleleForm{"", token};
    return std::nullopt;
}

std::optional<std::string> ParseRsId(const std::string& token) {
    if (token.size() > 2 && token.compare(0, 2, "rs") == 0 && AllDigits(token.substr(2))) {
        return token.substr(2);
    }
    return std::nullopt;
}

bool VariantTokensRelate(const std::string& a, const std::string& b) {
    if (a == b) return true;

    const auto rsA = ParseRsId(a);
    const auto rsB = ParseRsId(b);
    if (rsA && rsB) return *rsA == *rsB;
    if (rsA && AllDigits(b)) return *rsA == b;
    if (rsB && AllDigits(a)) return *rsB == a;

    const auto alleleA = ParseAllele(a);
    const auto alleleB = ParseAllele(b);
    if (alleleA && alleleB) {
        // "*4" and "*41" are different alleles even though one contains the other.
        if (alleleA->allele != alleleB->allele) return false;
        if (alleleA->gene.empty() || alleleB->gene.empty()) return true;
        if (alleleA->gene.find(alleleB->gene) != std::string::npos ||
            alleleB->gene.find(alleleA->gene) != std::string::npos) {
            return true;
        }
    }

    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer = a.size() <= b.size() ? b : a;
    return shorter.size() >= 3 && longer.find(shorter) != std::string::npos;
}

std::vector<std::string> SplitVariantTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) tokens.push_back(current);
        current.clear();
    };
    for (unsigned char c : text) {
        if (c == ',' || c == ';' || c == '+') {
            flush();
        } else if (!std::isspace(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    flush();
    return tokens;
}

// Same gene (or an unqualified side) but a different allele number, e.g. CYP2D6*4 vs CYP2D6*41.
bool HasAlleleConflict(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) {
    for (const auto& a : lhs) {
        const auto alleleA = ParseAllele(a);
        if (!alleleA) continue;
        for (const auto& b : rhs) {
            const auto alleleB = ParseAllele(b);
            if (!alleleB || alleleA->allele == alleleB->allele) continue;
            if (alleleA->gene.empty() || alleleB->gene.empty() ||
                alleleA->gene.find(alleleB->gene) != std::string::npos ||
                alleleB->gene.find(alleleA->gene) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

bool EveryTokenRelates(const std::vector<std::string>& from, const std::vector<std::string>& to) {
    return std::all_of(from.begin(), from.end(), [&](const std::string& token) {
        return std::any_of(to.begin(), to.end(), [&](const std::string& other) { return VariantTokensRelate(token, other); });
    });
}

// Strips "x10^", "×10" scientific spellings: "1.2x10^-5" -> 1.2e-5.
std::optional<double> ParseTimesTenNotation(const std::string& cleaned) {
    static const std::string kTimes = "\xC3\x97";
    for (const std::string& marker : {std::string("x10"), std::string("X10"), kTimes + "10"}) {
        const auto pos = cleaned.find(marker);
        if (pos == std::string::npos || pos == 0) continue;
        std::string exponent = cleaned.substr(pos + marker.size());
        if (!exponent.empty() && exponent[0] == '^') exponent.erase(0, 1);
        const auto mantissa = FieldEvaluators::parseNumeric(cleaned.substr(0, pos));
        const auto power = FieldEvaluators::parseNumeric(exponent);
        if (mantissa && power) {
            const double value = *mantissa * std::pow(10.0, *power);
            if (std::isfinite(value)) return value;
        }
    }
    return std::nullopt;
}

} // namespace

double FieldEvaluators::evaluate(const FieldSpec& spec, const FieldValue& predicted, const FieldValue& expected) {
    switch (spec.kind) {
        case EvaluatorKind::ExactMatch: return exactMatch(predicted, expected);
        case EvaluatorKind::CategoryEqual: return categoryEqual(predicted, expected);
        case EvaluatorKind::FuzzyEntity: return fuzzyEntityMatch(predicted, expected);
        case EvaluatorKind::SemanticSet: return semanticSetMatch(predicted, expected);
        case EvaluatorKind::NumericTolerance: return numericToleranceMatch(predicted, expected, spec.tolerance);
        case EvaluatorKind::CompoundStatistic: return compoundStatisticMatch(predicted, expected, spec.tolerance);
        case EvaluatorKind::VariantIdentity: return variantIdentityMatch(predicted, expected);
        default: return exactMatch(predicted, expected);
    }
}

double FieldEvaluators::exactMatch(const FieldValue& predicted, const FieldValue& expected) {
    if (auto shortcut = AbsenceScore(predicted.isAbsent(), expected.isAbsent())) return *shortcut;
    return normalizeText(predicted.toString()) == normalizeText(expected.toString()) ? 1.0 : 0.0;
}

double FieldEvaluators::categoryEqual(const FieldValue& predicted, const FieldValue& expected) {
    if (auto shortcut = AbsenceScore(predicted.isAbsent(), expected.isAbsent())) return *shortcut;
    return CollapseWhitespace(normalizeText(predicted.toString())) ==
                   CollapseWhitespace(normalizeText(expected.toString()))
               ? 1.0
               : 0.0;
}

double FieldEvaluators::fuzzyEntityMatch(const FieldValue& predicted, const FieldValue& expected) {
    if (auto shortcut = AbsenceScore(predicted.isAbsent(), expected.isAbsent())) return *shortcut;

    const double similarity = sequenceRatio(normalizeEntity(predicted.toString()), normalizeEntity(expected.toString()));
    if (similarity >= 0.9) return 1.0;
    if (similarity >= 0.7) return 0.8;
    if (similarity >= 0.5) return 0.5;
    return 0.0;
}

double FieldEvaluators::semanticSetMatch(const FieldValue& predicted, const FieldValue& expected) {
    if (auto shortcut = AbsenceScore(predicted.isAbsent(), expected.isAbsent())) return *shortcut;

    const std::string pred = normalizeText(predicted.toString());
    const std::string exp = normalizeText(expected.toString());
    if (pred == exp) return 1.0;

    const auto predTokens = tokenizeText(pred);
    const auto expTokens = tokenizeText(exp);
    const std::set<std::string> predSet(predTokens.begin(), predTokens.end());
    const std::set<std::string> expSet(expTokens.begin(), expTokens.end());

    if (predSet.empty() && expSet.empty()) return 1.0;
    if (predSet.empty() || expSet.empty()) return 0.0;

    size_t intersection = 0;
    for (const auto& token : predSet) {
        if (expSet.count(token)) ++intersection;
    }
    const size_t unionSize = predSet.size() + expSet.size() - intersection;
    return unionSize > 0 ? static_cast<double>(intersection) / static_cast<double>(unionSize) : 0.0;
}

double FieldEvaluators::numericToleranceMatch(const FieldValue& predicted, const FieldValue& expected,
                                              const ToleranceBands& bands) {
    return numericToleranceScore(parseNumeric(predicted), parseNumeric(expected), bands);
}

double FieldEvaluators::numericToleranceScore(std::optional<double> predicted, std::optional<double> expected,
                                              const ToleranceBands& bands) {
    if (auto shortcut = AbsenceScore(!predicted.has_value(), !expected.has_value())) return *shortcut;

    const double a = *predicted;
    const double b = *expected;
    if (a == b) return bands.exactWeight;
    if (a == 0.0 || b == 0.0) return 0.0;

    const double relative = std::fabs(a - b) / std::max(std::fabs(a), std::fabs(b));
    if (relative <= 0.05) return bands.within5Pct;
    if (relative <= 0.10) return bands.within10Pct;
    return 0.0;
}

double FieldEvaluators::compoundStatisticMatch(const FieldValue& predicted, const FieldValue& expected,
                                               const ToleranceBands& bands) {
    const auto pred = parseStatistic(predicted);
    const auto exp = parseStatistic(expected);
    if (auto shortcut = AbsenceScore(!pred.has_value(), !exp.has_value())) return *shortcut;

    const double operatorScore = pred->op == exp->op ? 1.0 : 0.0;

    const std::optional<double> predMagnitude = pred->magnitude;
    const std::optional<double> expMagnitude = exp->magnitude;
    double valueScore = numericToleranceScore(predMagnitude, expMagnitude, bands);
    // Small p-values are also compared by order of magnitude; the better of the two scores counts.
    if (predMagnitude && expMagnitude &&
        *predMagnitude > 0.0 && *predMagnitude < 1.0 && *expMagnitude > 0.0 && *expMagnitude < 1.0) {
        valueScore = std::max(valueScore, numericToleranceScore(-std::log10(*predMagnitude),
                                                                -std::log10(*expMagnitude), bands));
    }

    return 0.5 * operatorScore + 0.5 * valueScore;
}

double FieldEvaluators::variantIdentityMatch(const FieldValue& predicted, const FieldValue& expected) {
    if (auto shortcut = AbsenceScore(predicted.isAbsent(), expected.isAbsent())) return *shortcut;

    const auto predTokens = SplitVariantTokens(predicted.toString());
    const auto expTokens = SplitVariantTokens(expected.toString());
    if (!predTokens.empty() && !expTokens.empty() &&
        EveryTokenRelates(predTokens, expTokens) && EveryTokenRelates(expTokens, predTokens)) {
        return 1.0;
    }
    const double fallback = fuzzyEntityMatch(predicted, expected);
    if (HasAlleleConflict(predTokens, expTokens)) return std::min(fallback, kConflictingAlleleCap);
    return fallback;
}

std::optional<std::string> FieldEvaluators::classifyError(const FieldValue& predicted, const FieldValue& expected, double score) {
    if (score >= 1.0) return std::nullopt;
    if (predicted.isAbsent() && expected.isAbsent()) return std::nullopt;
    if (predicted.isAbsent()) return std::string("missing_prediction");
    if (expected.isAbsent()) return std::string("unexpected_prediction");

    const double predLength = static_cast<double>(Trim(predicted.toString()).size());
    const double expLength = static_cast<double>(Trim(expected.toString()).size());
    if (predLength < expLength * 0.5) return std::string("incomplete_extraction");
    if (predLength > expLength * 2.0) return std::string("over_extraction");
    return std::string("content_mismatch");
}

std::optional<double> FieldEvaluators::parseNumeric(const FieldValue& value) {
    if (value.isAbsent()) return std::nullopt;
    if (auto number = value.asNumber()) return number;
    return parseNumeric(value.toString());
}

std::optional<double> FieldEvaluators::parseNumeric(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        if (c == ',' || c == '$' || std::isspace(c)) continue;
        cleaned.push_back(static_cast<char>(c));
    }
    if (cleaned.empty()) return std::nullopt;

    const char* begin = cleaned.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin + cleaned.size() && std::isfinite(value)) {
        return value;
    }
    return ParseTimesTenNotation(cleaned);
}

std::optional<ParsedStatistic> FieldEvaluators::parseStatistic(const FieldValue& value) {
    if (value.isAbsent()) return std::nullopt;
    if (auto number = value.asNumber()) return ParsedStatistic{"=", number};

    const std::string text = Trim(value.toString());
    if (text.empty()) return std::nullopt;

    ParsedStatistic parsed;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, kLessEqual.size(), kLessEqual) == 0) {
            parsed.op = kLessEqual;
            break;
        }
        if (text.compare(i, kGreaterEqual.size(), kGreaterEqual) == 0) {
            parsed.op = kGreaterEqual;
            break;
        }
        const char c = text[i];
        if (c == '<' || c == '>' || c == '=') {
            const bool inclusive = i + 1 < text.size() && text[i + 1] == '=';
            if (c == '<') parsed.op = inclusive ? kLessEqual : "<";
            else if (c == '>') parsed.op = inclusive ? kGreaterEqual : ">";
            else parsed.op = "=";
            break;
        }
    }

    std::string remainder;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, kLessEqual.size(), kLessEqual) == 0 ||
            text.compare(i, kGreaterEqual.size(), kGreaterEqual) == 0) {
            i += kLessEqual.size() - 1;
            continue;
        }
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '<' || c == '>' || c == '=' || std::isspace(c)) continue;
        remainder.push_back(static_cast<char>(c));
    }
    if (!remainder.empty() && (remainder[0] == 'p' || remainder[0] == 'P')) {
        remainder.erase(0, 1);
    }
    parsed.magnitude = parseNumeric(remainder);
    return parsed;
}

std::string FieldEvaluators::normalizeText(const std::string& text) {
    std::string out = Trim(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string FieldEvaluators::normalizeEntity(const std::string& entity) {
    std::string text = entity;
    for (const char* prefix : {"rs", "cyp", "comt"}) {
        if (StartsWithIgnoreCase(text, prefix)) {
            text.erase(0, std::char_traits<char>::length(prefix));
            break;
        }
    }

    for (auto& ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (!(IsWordChar(c) || std::isspace(c) || c == '*' || c == '+' || c == '-')) {
            ch = ' ';
        }
    }
    return normalizeText(CollapseWhitespace(text));
}

std::vector<std::string> FieldEvaluators::tokenizeText(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() > 2 && !kStopWords.count(current)) tokens.push_back(current);
        current.clear();
    };
    for (unsigned char c : text) {
        if (IsWordChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

double FieldEvaluators::sequenceRatio(const std::string& a, const std::string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 1.0;

    std::unordered_map<char, std::vector<size_t>> b2j;
    for (size_t j = 0; j < b.size(); ++j) {
        b2j[b[j]].push_back(j);
    }
    // Long sequences: characters that are too frequent are not used as match anchors.
    if (b.size() >= 200) {
        const size_t popular = b.size() / 100 + 1;
        for (auto it = b2j.begin(); it != b2j.end();) {
            if (it->second.size() > popular) it = b2j.erase(it);
            else ++it;
        }
    }

    size_t matched = 0;
    std::vector<std::array<size_t, 4>> queue;
    queue.push_back({0, a.size(), 0, b.size()});
    while (!queue.empty()) {
        const auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();
        const Match m = FindLongestMatch(a, b, b2j, alo, ahi, blo, bhi);
        if (m.size == 0) continue;
        matched += m.size;
        if (alo < m.a && blo < m.b) queue.push_back({alo, m.a, blo, m.b});
        if (m.a + m.size < ahi && m.b + m.size < bhi) queue.push_back({m.a + m.size, ahi, m.b + m.size, bhi});
    }
    return 2.0 * static_cast<double>(matched) / static_cast<double>(total);
}

} // namespace annobench::domain::scoring
