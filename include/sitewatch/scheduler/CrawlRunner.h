#pragma once

#include "../auth/AuthConfig.h"
#include "../common/CancellationToken.h"
#include "../crawler/models/CrawlResult.h"
#include "../storage/Records.h"

#include <optional>
#include <string>

namespace sitewatch::scheduler {

// Runs the traversal for one job execution. The scheduler owns run
// bookkeeping and versioning; a runner only turns a job into a CrawlResult.
class CrawlRunner {
public:
    virtual ~CrawlRunner() = default;

    // May throw for configuration errors (bad patterns, unusable base URL);
    // the scheduler records those as a failed run.
    virtual crawler::CrawlResult run(const storage::CrawlJob& job,
                                     const std::optional<auth::AuthConfig>& credential,
                                     const std::string& runId,
                                     const common::CancellationToken& cancel) = 0;
};

} // namespace sitewatch::scheduler
