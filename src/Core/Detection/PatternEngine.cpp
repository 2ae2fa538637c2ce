/**
 * @file PatternEngine.cpp
 * @brief scanContent pipeline
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/PatternEngine.hpp>
#include <Argus/Core/Fingerprint.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <unordered_map>

namespace Argus::Core {

namespace {

size_t distance(size_t a, size_t b) noexcept {
    return a > b ? a - b : b - a;
}

size_t contextSize(const RawMatch& match) noexcept {
    return match.context.before.size() + match.context.after.size();
}

/// True if @p candidate should replace @p kept as the survivor
bool preferOver(const RawMatch& candidate, const RawMatch& kept) noexcept {
    if (contextSize(candidate) != contextSize(kept)) {
        return contextSize(candidate) > contextSize(kept);
    }
    if (candidate.value.size() != kept.value.size()) {
        return candidate.value.size() > kept.value.size();
    }
    return candidate.index < kept.index;
}

} // anonymous namespace

PatternEngine::PatternEngine(const PatternRegistry& registry, const LearningStore* learning)
    : m_registry(registry)
    , m_scorer(learning)
{
}

std::vector<RawMatch> PatternEngine::collapseNearbyMatches(std::vector<RawMatch> matches) {
    std::vector<RawMatch> kept;
    std::vector<std::string> keptValues;
    kept.reserve(matches.size());

    for (auto& match : matches) {
        std::string value = normalizeValue(match.value);
        bool merged = false;
        for (size_t i = 0; i < kept.size(); ++i) {
            if (keptValues[i] == value && distance(kept[i].index, match.index) <= PROXIMITY_WINDOW) {
                if (preferOver(match, kept[i])) {
                    kept[i] = std::move(match);
                }
                merged = true;
                break;
            }
        }
        if (!merged) {
            kept.push_back(std::move(match));
            keptValues.push_back(std::move(value));
        }
    }

    std::sort(kept.begin(), kept.end(),
              [](const RawMatch& a, const RawMatch& b) { return a.index < b.index; });
    return kept;
}

std::vector<Finding> PatternEngine::scanContent(std::string_view content, const ScanOptions& options) const {
    const MatchFinder finder(MatchOptions{options.contextWindow, options.maxMatchesPerPattern});
    const std::string file = options.filePath.value_or("");

    PositionLedger claimed;
    std::vector<Finding> findings;
    std::unordered_map<std::string, size_t> byKey;

    const auto patterns = m_registry.patternsFor(options.categories);
    for (const auto& pattern : patterns) {
        auto found = finder.find(content, *pattern, claimed);
        if (found.isFailure()) {
            ARGUS_LOG_WARNING_F("Skipping pattern '%s': %s", pattern->id.c_str(),
                                std::string(getErrorMessage(found.error())).c_str());
            continue;
        }

        for (auto& match : collapseNearbyMatches(std::move(found.value()))) {
            const double confidence = m_scorer.score(match, *pattern);
            if (confidence < options.confidenceThreshold) {
                continue;
            }
            claimed.claim(match.index, match.end());

            Location location = locate(content, match.index, file);

            if (options.enableDeduplication) {
                std::string key = pattern->id;
                key.push_back('\x1f');
                key.append(normalizeValue(match.value));

                auto it = byKey.find(key);
                if (it != byKey.end()) {
                    Finding& existing = findings[it->second];
                    existing.locations.push_back(std::move(location));
                    existing.occurrenceCount = existing.locations.size();
                    existing.confidence = std::max(existing.confidence, confidence);
                    existing.pattern.severity = maxSeverity(existing.pattern.severity, pattern->severity);
                    continue;
                }
                byKey.emplace(std::move(key), findings.size());
            }

            Finding finding;
            finding.match = std::move(match);
            finding.confidence = confidence;
            finding.pattern = pattern->summary();
            finding.locations.push_back(std::move(location));
            finding.occurrenceCount = 1;
            findings.push_back(std::move(finding));
        }
    }

    std::stable_sort(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
        if (a.confidence != b.confidence) {
            return a.confidence > b.confidence;
        }
        return a.match.index < b.match.index;
    });
    if (findings.size() > options.maxMatches) {
        findings.resize(options.maxMatches);
    }

    ARGUS_LOG_DEBUG_F("Scanned %zu characters with %zu patterns: %zu findings (%zu ranges claimed)",
                      content.size(), patterns.size(), findings.size(), claimed.size());
    return findings;
}

} // namespace Argus::Core
