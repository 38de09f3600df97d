#include "../../include/sitewatch/versioning/ChangeDetector.h"
#include "../../include/sitewatch/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sitewatch::versioning {

namespace {

// Above this many edits the exact diff is abandoned for a bag-of-words count
constexpr size_t kMaxEditDistance = 5000;

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

// Myers' greedy shortest edit script length (insertions + deletions) over
// a[aBegin, aEnd) and b[bBegin, bEnd). Returns std::string::npos when the
// distance exceeds `limit`.
size_t editDistance(const std::vector<std::string>& a, size_t aBegin, size_t aEnd,
                    const std::vector<std::string>& b, size_t bBegin, size_t bEnd,
                    size_t limit) {
    const long n = static_cast<long>(aEnd - aBegin);
    const long m = static_cast<long>(bEnd - bBegin);
    const long max = std::min<long>(n + m, static_cast<long>(limit));
    if (n == 0 || m == 0) {
        return static_cast<size_t>(n + m) <= limit ? static_cast<size_t>(n + m) : std::string::npos;
    }

    const long offset = max + 1;
    std::vector<long> v(static_cast<size_t>(2 * max + 3), 0);
    for (long d = 0; d <= max; ++d) {
        for (long k = -d; k <= d; k += 2) {
            long x;
            if (k == -d || (k != d && v[k - 1 + offset] < v[k + 1 + offset])) {
                x = v[k + 1 + offset];
            } else {
                x = v[k - 1 + offset] + 1;
            }
            long y = x - k;
            while (x < n && y < m && a[aBegin + x] == b[bBegin + y]) {
                ++x;
                ++y;
            }
            v[k + offset] = x;
            if (x >= n && y >= m) {
                return static_cast<size_t>(d);
            }
        }
    }
    return std::string::npos;
}

// Multiset difference; a lower bound of the true edit distance
void bagOfWordsDiff(const std::vector<std::string>& a, size_t aBegin, size_t aEnd,
                    const std::vector<std::string>& b, size_t bBegin, size_t bEnd,
                    size_t& added, size_t& removed) {
    std::unordered_map<std::string, long> counts;
    for (size_t i = aBegin; i < aEnd; ++i) ++counts[a[i]];
    for (size_t i = bBegin; i < bEnd; ++i) --counts[b[i]];
    added = 0;
    removed = 0;
    for (const auto& [word, count] : counts) {
        if (count > 0) removed += static_cast<size_t>(count);
        if (count < 0) added += static_cast<size_t>(-count);
    }
}

} // namespace

ChangeDetector::ChangeDetector(double thresholdPercent)
    : thresholdPercent_(thresholdPercent) {}

ChangeAnalysis ChangeDetector::detectChange(const std::string& oldContent, const std::string& newContent) const {
    ChangeAnalysis analysis;
    if (oldContent == newContent) {
        analysis.summary = "No changes detected";
        return analysis;
    }

    const std::vector<std::string> oldWords = splitWords(oldContent);
    const std::vector<std::string> newWords = splitWords(newContent);

    // Common prefix and suffix are unchanged words
    size_t prefix = 0;
    while (prefix < oldWords.size() && prefix < newWords.size() && oldWords[prefix] == newWords[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < oldWords.size() - prefix && suffix < newWords.size() - prefix &&
           oldWords[oldWords.size() - 1 - suffix] == newWords[newWords.size() - 1 - suffix]) {
        ++suffix;
    }
    const size_t oldEnd = oldWords.size() - suffix;
    const size_t newEnd = newWords.size() - suffix;
    const size_t oldMiddle = oldEnd - prefix;
    const size_t newMiddle = newEnd - prefix;

    size_t distance = editDistance(oldWords, prefix, oldEnd, newWords, prefix, newEnd, kMaxEditDistance);
    if (distance != std::string::npos) {
        // d = removed + added and removed - added = oldMiddle - newMiddle
        analysis.removedWords = (distance + oldMiddle - newMiddle) / 2;
        analysis.addedWords = distance - analysis.removedWords;
    } else {
        LOG_DEBUG("Word diff exceeds " + std::to_string(kMaxEditDistance) + " edits; using word-count difference");
        bagOfWordsDiff(oldWords, prefix, oldEnd, newWords, prefix, newEnd, analysis.addedWords, analysis.removedWords);
    }

    const size_t unchanged = oldWords.size() - analysis.removedWords;
    const size_t totalWords = unchanged + analysis.addedWords + analysis.removedWords;
    if (totalWords > 0) {
        double percentage = static_cast<double>(analysis.addedWords + analysis.removedWords) /
                            static_cast<double>(totalWords) * 100.0;
        analysis.changePercentage = std::round(percentage * 100.0) / 100.0;
        analysis.isSignificant = percentage > thresholdPercent_;
    }

    std::string summary;
    if (analysis.addedWords > 0) {
        summary = "+" + std::to_string(analysis.addedWords) + " words added";
    }
    if (analysis.removedWords > 0) {
        if (!summary.empty()) summary += ", ";
        summary += "-" + std::to_string(analysis.removedWords) + " words removed";
    }
    analysis.summary = summary.empty() ? "Minor changes detected" : summary;
    return analysis;
}

} // namespace sitewatch::versioning
