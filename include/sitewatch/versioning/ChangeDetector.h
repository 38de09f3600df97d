#pragma once

#include <cstddef>
#include <string>

namespace sitewatch::versioning {

struct ChangeAnalysis {
    double changePercentage = 0.0;  // 0..100, two decimals
    std::string summary;
    bool isSignificant = false;
    size_t addedWords = 0;
    size_t removedWords = 0;
};

// Word-level diff of two page contents.
//
// changePercentage = (added + removed) / (added + removed + unchanged) * 100,
// where the counts come from a minimal word edit script. A change is
// significant when the percentage exceeds the threshold.
class ChangeDetector {
public:
    explicit ChangeDetector(double thresholdPercent = 5.0);

    ChangeAnalysis detectChange(const std::string& oldContent, const std::string& newContent) const;

    double thresholdPercent() const { return thresholdPercent_; }

private:
    double thresholdPercent_;
};

} // namespace sitewatch::versioning
