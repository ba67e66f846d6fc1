/**
 * @file task_analyzer.hpp
 * @brief Keyword-based classification of raw task descriptions.
 *
 * Decides a complexity tier and a ranked list of domains for a task. Never
 * fails: ambiguous or empty input resolves through deterministic fallbacks.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace workflow_orchestrator {

/**
 * @brief Immutable result of analysing one raw task description.
 */
struct TaskAnalysis {
    std::string description;
    Complexity complexity = Complexity::Simple;
    std::vector<std::string> domains;           ///< Highest score first; never empty
    bool requires_decomposition = false;
    size_t estimated_subtasks = 1;
    std::vector<std::string> key_requirements;

    [[nodiscard]] const std::string& primary_domain() const noexcept { return domains.front(); }
};

/**
 * @brief Classifies tasks by complexity and domain.
 */
class TaskAnalyzer {
public:
    /// A domain vocabulary: keywords that score one point each, plus
    /// priority keywords that add a half-point tie-break bonus once.
    struct DomainVocabulary {
        std::string domain;
        std::vector<std::string> keywords;
        std::vector<std::string> priority_keywords;
    };

    explicit TaskAnalyzer(AnalyzerConfig config = {});

    [[nodiscard]] TaskAnalysis analyze(std::string_view description) const;

    // ── Individual heuristics (exposed for testing) ──
    [[nodiscard]] Complexity determine_complexity(std::string_view lowered) const;
    [[nodiscard]] std::vector<std::string> identify_domains(std::string_view lowered) const;
    [[nodiscard]] std::vector<std::string> extract_requirements(std::string_view description) const;
    [[nodiscard]] size_t estimate_subtasks(Complexity complexity, std::string_view lowered) const;
    [[nodiscard]] size_t count_action_verbs(std::string_view lowered) const;

    [[nodiscard]] const std::vector<DomainVocabulary>& vocabularies() const noexcept {
        return vocabularies_;
    }

private:
    AnalyzerConfig config_;
    std::vector<std::string> simple_markers_;
    std::vector<std::string> medium_markers_;
    std::vector<std::string> complex_markers_;
    std::vector<std::string> action_verbs_;
    std::vector<DomainVocabulary> vocabularies_;
};

}  // namespace workflow_orchestrator
