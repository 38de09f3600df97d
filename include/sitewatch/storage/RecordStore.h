#pragma once

#include "Records.h"
#include "../common/Result.h"

#include <optional>
#include <string>
#include <vector>

namespace sitewatch::storage {

// Transactional record store used by the scheduler and the versioner.
// Operations never throw on storage errors; they return a failed Result.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Jobs
    virtual Result<std::vector<CrawlJob>> listActiveJobs() = 0;
    // Fails when the job does not exist
    virtual Result<CrawlJob> getJob(const std::string& jobId) = 0;
    // Insert or replace by id
    virtual Result<bool> saveJob(const CrawlJob& job) = 0;
    virtual Result<bool> updateJobStatus(const std::string& jobId,
                                         JobStatus status,
                                         const std::optional<TimePoint>& lastRun,
                                         const std::optional<TimePoint>& nextRun) = 0;
    // Atomically marks the job RUNNING with lastRun = startedAt. A job already
    // RUNNING is only taken over when its lastRun is older than staleBefore.
    // Returns false when another run holds the job.
    virtual Result<bool> tryMarkJobRunning(const std::string& jobId,
                                           TimePoint startedAt,
                                           TimePoint staleBefore) = 0;

    // Runs
    virtual Result<std::string> createRun(const JobRun& run) = 0;
    // Moves a RUNNING run to its final state; fails for runs already finished
    virtual Result<bool> finishRun(const JobRun& run) = 0;
    virtual Result<JobRun> getRun(const std::string& runId) = 0;
    // Newest first
    virtual Result<std::vector<JobRun>> listRuns(const std::string& jobId, int limit) = 0;

    // Credentials
    virtual Result<CredentialDescriptor> getCredential(const std::string& credentialId) = 0;
    virtual Result<bool> saveCredential(const CredentialDescriptor& credential) = 0;

    // Versioned documents
    virtual Result<std::optional<VersionedDocument>> getActiveDocument(const std::string& tenantId,
                                                                       const std::string& url) = 0;
    // Oldest version first
    virtual Result<std::vector<VersionedDocument>> listDocumentVersions(const std::string& tenantId,
                                                                        const std::string& url) = 0;

    // Single transaction: insert `document`, deactivate `previousVersionId`
    // (which must still be the active version) and insert `change`. Nothing
    // is written when any step fails.
    virtual Result<bool> commitVersion(const VersionedDocument& document,
                                       const std::optional<std::string>& previousVersionId,
                                       const ChangeRecord& change) = 0;

    virtual Result<bool> updateDocumentEmbedding(const std::string& documentId,
                                                 const std::vector<float>& embedding) = 0;

    // Oldest first
    virtual Result<std::vector<ChangeRecord>> listChanges(const std::string& tenantId,
                                                          const std::string& url) = 0;
};

} // namespace sitewatch::storage
