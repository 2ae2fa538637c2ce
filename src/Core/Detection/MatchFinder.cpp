/**
 * @file MatchFinder.cpp
 * @brief Regex iteration, overlap rejection and false-positive filtering
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/MatchFinder.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <exception>

namespace Argus::Core {

namespace {

using Submatches = std::vector<re2::StringPiece>;

std::string pieceString(const re2::StringPiece& piece) {
    return piece.data() == nullptr ? std::string() : std::string(piece.data(), piece.size());
}

bool intersects(size_t aStart, size_t aEnd, size_t bStart, size_t bEnd) noexcept {
    return (aStart >= bStart && aStart < bEnd) ||
           (aEnd > bStart && aEnd <= bEnd) ||
           (aStart <= bStart && aEnd >= bEnd);
}

std::string lowerCopy(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

RawMatch buildMatch(std::string_view content, const Submatches& m, size_t start,
                    const CompiledPattern& pattern, size_t window) {
    const size_t length = m[0].size();
    const size_t end = start + length;
    const size_t contextStart = start > window ? start - window : 0;
    const size_t contextEnd = std::min(content.size(), end + window);

    RawMatch raw;
    raw.fullMatch = pieceString(m[0]);
    raw.index = start;
    raw.length = length;
    raw.context.before = std::string(content.substr(contextStart, start - contextStart));
    raw.context.after = std::string(content.substr(end, contextEnd - end));
    raw.context.full = std::string(content.substr(contextStart, contextEnd - contextStart));

    raw.groups.reserve(m.size() - 1);
    for (size_t i = 1; i < m.size(); ++i) {
        raw.groups.push_back(pieceString(m[i]));
    }

    if (pattern.extractGroup && *pattern.extractGroup < m.size() &&
        m[*pattern.extractGroup].data() != nullptr) {
        raw.value = pieceString(m[*pattern.extractGroup]);
    } else {
        raw.value = raw.fullMatch;
    }
    return raw;
}

} // anonymous namespace

// ============================================================================
// PositionLedger
// ============================================================================

bool PositionLedger::overlaps(size_t start, size_t end) const noexcept {
    return std::any_of(m_ranges.begin(), m_ranges.end(), [&](const auto& range) {
        return intersects(start, end, range.first, range.second);
    });
}

void PositionLedger::claim(size_t start, size_t end) {
    m_ranges.emplace_back(start, end);
}

// ============================================================================
// MatchFinder
// ============================================================================

bool MatchFinder::isFalsePositive(const RawMatch& match, const CompiledPattern& pattern) {
    if (pattern.filters.empty()) {
        return false;
    }

    std::string loweredContext;
    for (const auto& filter : pattern.filters) {
        switch (filter.kind) {
            case FalsePositiveFilter::Kind::Regex:
                if (filter.regex && (RE2::PartialMatch(match.value, *filter.regex) ||
                                     RE2::PartialMatch(match.fullMatch, *filter.regex))) {
                    return true;
                }
                break;
            case FalsePositiveFilter::Kind::Keyword:
                if (loweredContext.empty()) {
                    loweredContext = lowerCopy(match.context.full);
                }
                if (loweredContext.find(filter.expression) != std::string::npos) {
                    return true;
                }
                break;
            case FalsePositiveFilter::Kind::Predicate:
                if (filter.predicate && filter.predicate(match)) {
                    return true;
                }
                break;
        }
    }
    return false;
}

Result<std::vector<RawMatch>> MatchFinder::find(std::string_view content,
                                                const CompiledPattern& pattern,
                                                const PositionLedger& claimed) const {
    if (!pattern.regex || !pattern.regex->ok()) {
        ARGUS_LOG_WARNING_F("Pattern '%s' has no usable regex", pattern.id.c_str());
        return ErrorCode::RegexEvaluationFailed;
    }

    const RE2& regex = *pattern.regex;
    const re2::StringPiece text(content.data(), content.size());
    Submatches m(static_cast<size_t>(regex.NumberOfCapturingGroups()) + 1);

    std::vector<RawMatch> accepted;
    PositionLedger ownClaims;
    size_t cursor = 0;

    while (cursor <= content.size() && accepted.size() < m_options.maxMatches) {
        if (!regex.Match(text, cursor, content.size(), RE2::UNANCHORED,
                         m.data(), static_cast<int>(m.size()))) {
            break;
        }

        const size_t start = static_cast<size_t>(m[0].data() - content.data());
        const size_t length = m[0].size();

        if (length == 0) {
            cursor = start + 1;
            continue;
        }
        cursor = start + length;

        if (claimed.overlaps(start, start + length) || ownClaims.overlaps(start, start + length)) {
            continue;
        }

        RawMatch raw = buildMatch(content, m, start, pattern, m_options.contextWindow);
        try {
            if (isFalsePositive(raw, pattern)) {
                ARGUS_LOG_TRACE_F("Pattern '%s' candidate at %zu filtered as false positive",
                                  pattern.id.c_str(), start);
                continue;
            }
        } catch (const std::exception& e) {
            ARGUS_LOG_WARNING_F("Pattern '%s' false-positive filter threw at offset %zu: %s",
                                pattern.id.c_str(), start, e.what());
            return ErrorCode::FilterFailed;
        } catch (...) {
            ARGUS_LOG_WARNING_F("Pattern '%s' false-positive filter threw a non-standard exception at offset %zu",
                                pattern.id.c_str(), start);
            return ErrorCode::FilterFailed;
        }

        ownClaims.claim(start, start + length);
        accepted.push_back(std::move(raw));
    }

    return accepted;
}

} // namespace Argus::Core
