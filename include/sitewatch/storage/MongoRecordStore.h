#pragma once

#include "RecordStore.h"

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace sitewatch::storage {

// RecordStore on MongoDB. Version commits use a multi-document transaction,
// so the server must run as a replica set. One client is shared by all
// callers and serialized with a mutex.
class MongoRecordStore : public RecordStore {
public:
    // Throws std::runtime_error when the connection cannot be set up.
    explicit MongoRecordStore(const std::string& connectionString = "mongodb://localhost:27017",
                              const std::string& databaseName = "sitewatch");
    ~MongoRecordStore() override = default;

    MongoRecordStore(const MongoRecordStore&) = delete;
    MongoRecordStore& operator=(const MongoRecordStore&) = delete;

    Result<std::vector<CrawlJob>> listActiveJobs() override;
    Result<CrawlJob> getJob(const std::string& jobId) override;
    Result<bool> saveJob(const CrawlJob& job) override;
    Result<bool> updateJobStatus(const std::string& jobId,
                                 JobStatus status,
                                 const std::optional<TimePoint>& lastRun,
                                 const std::optional<TimePoint>& nextRun) override;
    Result<bool> tryMarkJobRunning(const std::string& jobId,
                                   TimePoint startedAt,
                                   TimePoint staleBefore) override;

    Result<std::string> createRun(const JobRun& run) override;
    Result<bool> finishRun(const JobRun& run) override;
    Result<JobRun> getRun(const std::string& runId) override;
    Result<std::vector<JobRun>> listRuns(const std::string& jobId, int limit) override;

    Result<CredentialDescriptor> getCredential(const std::string& credentialId) override;
    Result<bool> saveCredential(const CredentialDescriptor& credential) override;

    Result<std::optional<VersionedDocument>> getActiveDocument(const std::string& tenantId,
                                                               const std::string& url) override;
    Result<std::vector<VersionedDocument>> listDocumentVersions(const std::string& tenantId,
                                                                const std::string& url) override;
    Result<bool> commitVersion(const VersionedDocument& document,
                               const std::optional<std::string>& previousVersionId,
                               const ChangeRecord& change) override;
    Result<bool> updateDocumentEmbedding(const std::string& documentId,
                                         const std::vector<float>& embedding) override;
    Result<std::vector<ChangeRecord>> listChanges(const std::string& tenantId,
                                                  const std::string& url) override;

    Result<bool> ensureIndexes();

private:
    // Conversion methods between records and BSON
    bsoncxx::document::value crawlJobToBson(const CrawlJob& job) const;
    CrawlJob bsonToCrawlJob(const bsoncxx::document::view& doc) const;
    bsoncxx::document::value jobRunToBson(const JobRun& run) const;
    JobRun bsonToJobRun(const bsoncxx::document::view& doc) const;
    bsoncxx::document::value documentToBson(const VersionedDocument& document) const;
    VersionedDocument bsonToDocument(const bsoncxx::document::view& doc) const;
    bsoncxx::document::value changeToBson(const ChangeRecord& change) const;
    ChangeRecord bsonToChange(const bsoncxx::document::view& doc) const;
    bsoncxx::document::value credentialToBson(const CredentialDescriptor& credential) const;
    CredentialDescriptor bsonToCredential(const bsoncxx::document::view& doc) const;

    std::unique_ptr<mongocxx::client> client_;
    mongocxx::database database_;
    mongocxx::collection jobsCollection_;
    mongocxx::collection runsCollection_;
    mongocxx::collection documentsCollection_;
    mongocxx::collection changesCollection_;
    mongocxx::collection credentialsCollection_;
    std::mutex clientMutex_;
};

} // namespace sitewatch::storage
