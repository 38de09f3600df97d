#pragma once

#include "../../include/sitewatch/storage/RecordStore.h"

#include <algorithm>
#include <map>
#include <mutex>

namespace sitewatch::testing {

// RecordStore kept in process memory with the same transactional rules as
// the Mongo store: a version commit either writes everything or nothing.
class InMemoryRecordStore : public storage::RecordStore {
public:
    using TimePoint = storage::TimePoint;

    Result<std::vector<storage::CrawlJob>> listActiveJobs() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<storage::CrawlJob> jobs;
        for (const auto& [id, job] : jobs_) {
            if (job.isActive) jobs.push_back(job);
        }
        return Result<std::vector<storage::CrawlJob>>::Success(jobs, "ok");
    }

    Result<storage::CrawlJob> getJob(const std::string& jobId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return Result<storage::CrawlJob>::Failure("Job not found: " + jobId);
        return Result<storage::CrawlJob>::Success(it->second, "ok");
    }

    Result<bool> saveJob(const storage::CrawlJob& job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[job.id] = job;
        return Result<bool>::Success(true, "ok");
    }

    Result<bool> updateJobStatus(const std::string& jobId,
                                 storage::JobStatus status,
                                 const std::optional<TimePoint>& lastRun,
                                 const std::optional<TimePoint>& nextRun) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return Result<bool>::Failure("Job not found: " + jobId);
        it->second.status = status;
        it->second.lastRun = lastRun;
        it->second.nextRun = nextRun;
        statusHistory_.push_back(status);
        return Result<bool>::Success(true, "ok");
    }

    Result<bool> tryMarkJobRunning(const std::string& jobId,
                                   TimePoint startedAt,
                                   TimePoint staleBefore) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return Result<bool>::Failure("Job not found: " + jobId);
        auto& job = it->second;
        if (job.status == storage::JobStatus::RUNNING && job.lastRun && *job.lastRun >= staleBefore) {
            return Result<bool>::Success(false, "Job is already running");
        }
        job.status = storage::JobStatus::RUNNING;
        job.lastRun = startedAt;
        statusHistory_.push_back(storage::JobStatus::RUNNING);
        return Result<bool>::Success(true, "ok");
    }

    Result<std::string> createRun(const storage::JobRun& run) override {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_.push_back(run);
        return Result<std::string>::Success(run.id, "ok");
    }

    Result<bool> finishRun(const storage::JobRun& run) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& stored : runs_) {
            if (stored.id == run.id) {
                if (stored.status != storage::RunStatus::RUNNING || run.status == storage::RunStatus::RUNNING) {
                    return Result<bool>::Failure("Run is not running");
                }
                stored = run;
                return Result<bool>::Success(true, "ok");
            }
        }
        return Result<bool>::Failure("Run not found");
    }

    Result<storage::JobRun> getRun(const std::string& runId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& run : runs_) {
            if (run.id == runId) return Result<storage::JobRun>::Success(run, "ok");
        }
        return Result<storage::JobRun>::Failure("Run not found");
    }

    Result<std::vector<storage::JobRun>> listRuns(const std::string& jobId, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<storage::JobRun> out;
        for (auto it = runs_.rbegin(); it != runs_.rend() && static_cast<int>(out.size()) < limit; ++it) {
            if (it->jobId == jobId) out.push_back(*it);
        }
        return Result<std::vector<storage::JobRun>>::Success(out, "ok");
    }

    Result<storage::CredentialDescriptor> getCredential(const std::string& credentialId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = credentials_.find(credentialId);
        if (it == credentials_.end()) return Result<storage::CredentialDescriptor>::Failure("Credential not found");
        return Result<storage::CredentialDescriptor>::Success(it->second, "ok");
    }

    Result<bool> saveCredential(const storage::CredentialDescriptor& credential) override {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_[credential.id] = credential;
        return Result<bool>::Success(true, "ok");
    }

    Result<std::optional<storage::VersionedDocument>> getActiveDocument(const std::string& tenantId,
                                                                        const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& doc : documents_) {
            if (doc.tenantId == tenantId && doc.url == url && doc.isActive) {
                return Result<std::optional<storage::VersionedDocument>>::Success(doc, "ok");
            }
        }
        return Result<std::optional<storage::VersionedDocument>>::Success(std::nullopt, "none");
    }

    Result<std::vector<storage::VersionedDocument>> listDocumentVersions(const std::string& tenantId,
                                                                         const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<storage::VersionedDocument> out;
        for (const auto& doc : documents_) {
            if (doc.tenantId == tenantId && doc.url == url) out.push_back(doc);
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.version < b.version; });
        return Result<std::vector<storage::VersionedDocument>>::Success(out, "ok");
    }

    Result<bool> commitVersion(const storage::VersionedDocument& document,
                               const std::optional<std::string>& previousVersionId,
                               const storage::ChangeRecord& change) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failCommits) return Result<bool>::Failure("commit rejected");

        storage::VersionedDocument* previous = nullptr;
        if (previousVersionId) {
            for (auto& doc : documents_) {
                if (doc.id == *previousVersionId) previous = &doc;
            }
            if (!previous || !previous->isActive) {
                return Result<bool>::Failure("Previous version is no longer active");
            }
        }
        for (const auto& doc : documents_) {
            if (doc.tenantId == document.tenantId && doc.url == document.url &&
                (doc.version == document.version || (doc.isActive && doc.id != (previousVersionId ? *previousVersionId : "")))) {
                return Result<bool>::Failure("Version conflict");
            }
        }

        if (previous) previous->isActive = false;
        documents_.push_back(document);
        changes_.push_back(change);
        return Result<bool>::Success(true, "ok");
    }

    Result<bool> updateDocumentEmbedding(const std::string& documentId,
                                         const std::vector<float>& embedding) override {
        std::lock_guard<std::mutex> lock(mutex_);
        embeddings_[documentId] = embedding;
        return Result<bool>::Success(true, "ok");
    }

    Result<std::vector<storage::ChangeRecord>> listChanges(const std::string& tenantId,
                                                           const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<storage::ChangeRecord> out;
        for (const auto& change : changes_) {
            if (change.tenantId == tenantId && change.url == url) out.push_back(change);
        }
        return Result<std::vector<storage::ChangeRecord>>::Success(out, "ok");
    }

    std::vector<storage::JobRun> runs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runs_;
    }

    std::vector<storage::JobStatus> statusHistory() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statusHistory_;
    }

    size_t documentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return documents_.size();
    }

    size_t changeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return changes_.size();
    }

    std::optional<std::vector<float>> embeddingFor(const std::string& documentId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = embeddings_.find(documentId);
        if (it == embeddings_.end()) return std::nullopt;
        return it->second;
    }

    bool failCommits = false;

private:
    mutable std::mutex mutex_;
    std::map<std::string, storage::CrawlJob> jobs_;
    std::vector<storage::JobStatus> statusHistory_;
    std::vector<storage::JobRun> runs_;
    std::map<std::string, storage::CredentialDescriptor> credentials_;
    std::vector<storage::VersionedDocument> documents_;
    std::vector<storage::ChangeRecord> changes_;
    std::map<std::string, std::vector<float>> embeddings_;
};

} // namespace sitewatch::testing
