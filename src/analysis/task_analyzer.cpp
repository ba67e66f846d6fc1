/**
 * @file task_analyzer.cpp
 * @brief TaskAnalyzer implementation: keyword scoring heuristics.
 *
 * All matching is case-insensitive substring matching on the lowered text,
 * so "deployment" counts for "deploy" and "testing" for "test".
 */

#include "analysis/task_analyzer.hpp"

#include <algorithm>
#include <cctype>

namespace workflow_orchestrator {

namespace {

constexpr std::string_view kGeneralDomain = "general";
constexpr size_t kMinRequirementLength = 5;

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

size_t count_matches(std::string_view text, const std::vector<std::string>& keywords) {
    return static_cast<size_t>(std::count_if(keywords.begin(), keywords.end(),
        [text](const std::string& kw) { return contains(text, kw); }));
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}  // namespace

TaskAnalyzer::TaskAnalyzer(AnalyzerConfig config)
    : config_(config)
    , simple_markers_{"simple", "quick", "one", "single", "just"}
    , medium_markers_{"multi", "several", "multiple", "few"}
    , complex_markers_{"system", "full", "complete", "comprehensive", "enterprise", "integrate"}
    , action_verbs_{"create", "build", "develop", "design", "implement",
                    "deploy", "test", "analyze", "integrate", "configure"}
    , vocabularies_{
          {"development", {"code", "develop", "build", "implement", "api", "function", "python", "rest"}, {}},
          {"devops", {"deploy", "infrastructure", "cloud", "docker", "kubernetes", "ci/cd", "aws"},
                     {"deploy", "cloud", "aws", "kubernetes", "infrastructure"}},
          {"data", {"data", "analyze", "dashboard", "report", "statistics", "visualization"},
                   {"data", "analyze", "dashboard"}},
          {"research", {"research", "investigate", "study", "evaluate"}, {}},
          {"design", {"design", "ui", "ux", "mockup", "prototype", "interface"}, {}},
          {"testing", {"test", "qa", "testing", "validation", "verify"}, {"test", "qa"}}
      } {}

TaskAnalysis TaskAnalyzer::analyze(std::string_view description) const {
    auto lowered = to_lower(description);

    TaskAnalysis analysis;
    analysis.description = std::string(description);
    analysis.complexity = determine_complexity(lowered);
    analysis.domains = identify_domains(lowered);
    analysis.key_requirements = extract_requirements(description);
    analysis.requires_decomposition = analysis.complexity != Complexity::Simple;
    analysis.estimated_subtasks = estimate_subtasks(analysis.complexity, lowered);
    return analysis;
}

size_t TaskAnalyzer::count_action_verbs(std::string_view lowered) const {
    return count_matches(lowered, action_verbs_);
}

Complexity TaskAnalyzer::determine_complexity(std::string_view lowered) const {
    size_t complex_score = count_matches(lowered, complex_markers_);
    size_t medium_score = count_matches(lowered, medium_markers_);
    size_t simple_score = count_matches(lowered, simple_markers_);
    size_t action_count = count_action_verbs(lowered);

    if (complex_score > 0 || action_count > 3) {
        return Complexity::Complex;
    }
    // An action verb without an explicit "simple" marker is at least medium
    if (action_count >= 1 && simple_score == 0) {
        return Complexity::Medium;
    }
    if (simple_score > 0 && action_count <= 1) {
        return Complexity::Simple;
    }
    if (medium_score > 0 || action_count > 1) {
        return Complexity::Medium;
    }
    return Complexity::Simple;
}

std::vector<std::string> TaskAnalyzer::identify_domains(std::string_view lowered) const {
    struct Scored {
        const std::string* domain;
        double score;
    };

    std::vector<Scored> scored;
    for (const auto& vocab : vocabularies_) {
        auto hits = count_matches(lowered, vocab.keywords);
        if (hits == 0) continue;

        double score = static_cast<double>(hits);
        if (count_matches(lowered, vocab.priority_keywords) > 0) {
            score += 0.5;
        }
        scored.push_back({&vocab.domain, score});
    }

    // Stable: equal scores keep vocabulary order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });

    std::vector<std::string> domains;
    domains.reserve(scored.size());
    for (const auto& s : scored) {
        domains.push_back(*s.domain);
    }

    if (domains.empty()) {
        domains.emplace_back(kGeneralDomain);
    }
    return domains;
}

std::vector<std::string> TaskAnalyzer::extract_requirements(std::string_view description) const {
    // Separators: ',', newline and the word " and "
    std::string normalized;
    normalized.reserve(description.size());
    for (size_t i = 0; i < description.size(); ++i) {
        if (description.substr(i, 5) == " and ") {
            normalized += '\n';
            i += 4;
        } else if (description[i] == ',') {
            normalized += '\n';
        } else {
            normalized += description[i];
        }
    }

    std::vector<std::string> requirements;
    std::string_view rest = normalized;
    while (!rest.empty() && requirements.size() < config_.max_requirements) {
        auto pos = rest.find('\n');
        auto part = trim(rest.substr(0, pos));
        if (part.size() > kMinRequirementLength) {
            requirements.emplace_back(part);
        }
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    return requirements;
}

size_t TaskAnalyzer::estimate_subtasks(Complexity complexity, std::string_view lowered) const {
    size_t base = 1;
    switch (complexity) {
        case Complexity::Simple:  base = 1; break;
        case Complexity::Medium:  base = 3; break;
        case Complexity::Complex: base = 5; break;
    }
    return std::min(base + count_action_verbs(lowered), config_.max_estimated_subtasks);
}

}  // namespace workflow_orchestrator
