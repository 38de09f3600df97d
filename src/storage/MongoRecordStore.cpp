#include "../../include/sitewatch/storage/MongoRecordStore.h"
#include "../../include/sitewatch/storage/MongoInstance.h"
#include "../../include/sitewatch/common/Logger.h"
#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/stream/helpers.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client_session.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/options/replace.hpp>
#include <mongocxx/uri.hpp>
#include <stdexcept>

using namespace bsoncxx::builder::stream;

namespace sitewatch::storage {

namespace {

    // Helper function to convert time_point to BSON date
    bsoncxx::types::b_date timePointToBsonDate(const TimePoint& tp) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
        return bsoncxx::types::b_date{millis};
    }

    // Helper function to convert BSON date to time_point
    TimePoint bsonDateToTimePoint(const bsoncxx::types::b_date& date) {
        return TimePoint{date.value};
    }

    std::string getString(const bsoncxx::document::view& doc, const char* key, const std::string& fallback = "") {
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_string) {
            return fallback;
        }
        return std::string(element.get_string().value);
    }

    std::optional<std::string> getOptionalString(const bsoncxx::document::view& doc, const char* key) {
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_string) {
            return std::nullopt;
        }
        return std::string(element.get_string().value);
    }

    int64_t getInt(const bsoncxx::document::view& doc, const char* key, int64_t fallback = 0) {
        auto element = doc[key];
        if (!element) return fallback;
        switch (element.type()) {
            case bsoncxx::type::k_int32: return element.get_int32().value;
            case bsoncxx::type::k_int64: return element.get_int64().value;
            case bsoncxx::type::k_double: return static_cast<int64_t>(element.get_double().value);
            default: return fallback;
        }
    }

    double getDouble(const bsoncxx::document::view& doc, const char* key) {
        auto element = doc[key];
        if (!element) return 0.0;
        switch (element.type()) {
            case bsoncxx::type::k_double: return element.get_double().value;
            case bsoncxx::type::k_int32: return element.get_int32().value;
            case bsoncxx::type::k_int64: return static_cast<double>(element.get_int64().value);
            default: return 0.0;
        }
    }

    bool getBool(const bsoncxx::document::view& doc, const char* key, bool fallback) {
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_bool) {
            return fallback;
        }
        return element.get_bool().value;
    }

    std::optional<TimePoint> getDate(const bsoncxx::document::view& doc, const char* key) {
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_date) {
            return std::nullopt;
        }
        return bsonDateToTimePoint(element.get_date());
    }

    std::vector<std::string> getStringArray(const bsoncxx::document::view& doc, const char* key) {
        std::vector<std::string> values;
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_array) {
            return values;
        }
        for (const auto& item : element.get_array().value) {
            if (item.type() == bsoncxx::type::k_string) {
                values.emplace_back(item.get_string().value);
            }
        }
        return values;
    }

    bsoncxx::array::value stringArray(const std::vector<std::string>& values) {
        bsoncxx::builder::basic::array array;
        for (const auto& value : values) {
            array.append(value);
        }
        return array.extract();
    }

    // nlohmann::json objects are stored as embedded documents
    bsoncxx::document::value jsonToBson(const nlohmann::json& json) {
        return bsoncxx::from_json(json.is_object() ? json.dump() : "{}");
    }

    nlohmann::json getJson(const bsoncxx::document::view& doc, const char* key) {
        auto element = doc[key];
        if (!element || element.type() != bsoncxx::type::k_document) {
            return nlohmann::json::object();
        }
        return nlohmann::json::parse(bsoncxx::to_json(element.get_document().value), nullptr, false);
    }

} // namespace

MongoRecordStore::MongoRecordStore(const std::string& connectionString, const std::string& databaseName) {
    LOG_DEBUG("MongoRecordStore constructor called with database: " + databaseName);
    try {
        MongoInstance::getInstance();

        mongocxx::uri uri{connectionString};
        client_ = std::make_unique<mongocxx::client>(uri);
        database_ = (*client_)[databaseName];
        jobsCollection_ = database_["crawl_jobs"];
        runsCollection_ = database_["job_runs"];
        documentsCollection_ = database_["versioned_documents"];
        changesCollection_ = database_["change_records"];
        credentialsCollection_ = database_["credentials"];
        LOG_INFO("Connected to MongoDB database: " + databaseName);
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to initialize MongoDB connection: " + std::string(e.what()));
        throw std::runtime_error("Failed to initialize MongoDB connection: " + std::string(e.what()));
    }

    auto indexes = ensureIndexes();
    if (!indexes.success) {
        LOG_WARNING("MongoDB indexes not ensured: " + indexes.message);
    }
}

Result<bool> MongoRecordStore::ensureIndexes() {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        runsCollection_.create_index((document{} << "jobId" << 1 << "startedAt" << -1 << finalize).view());
        jobsCollection_.create_index((document{} << "isActive" << 1 << finalize).view());
        changesCollection_.create_index((document{} << "tenantId" << 1 << "url" << 1 << "detectedAt" << 1 << finalize).view());

        mongocxx::options::index uniqueVersion;
        uniqueVersion.unique(true);
        documentsCollection_.create_index(
            (document{} << "tenantId" << 1 << "url" << 1 << "version" << 1 << finalize).view(), uniqueVersion);

        // At most one active version per (tenant, url)
        auto activeFilter = document{} << "isActive" << true << finalize;
        mongocxx::options::index uniqueActive;
        uniqueActive.unique(true);
        uniqueActive.partial_filter_expression(activeFilter.view());
        documentsCollection_.create_index(
            (document{} << "tenantId" << 1 << "url" << 1 << finalize).view(), uniqueActive);

        LOG_INFO("MongoDB indexes created successfully");
        return Result<bool>::Success(true, "Indexes created successfully");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error creating indexes: " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

// ---------------------------------------------------------------------------
// BSON conversion

bsoncxx::document::value MongoRecordStore::crawlJobToBson(const CrawlJob& job) const {
    auto builder = document{};
    auto includes = stringArray(job.includePatterns);
    auto excludes = stringArray(job.excludePatterns);
    auto options = jsonToBson(job.options);

    builder << "_id" << job.id
            << "tenantId" << job.tenantId
            << "name" << job.name
            << "baseUrl" << job.baseUrl
            << "schedule" << job.schedule
            << "includePatterns" << bsoncxx::types::b_array{includes.view()}
            << "excludePatterns" << bsoncxx::types::b_array{excludes.view()}
            << "maxDepth" << job.maxDepth
            << "maxPages" << job.maxPages
            << "options" << bsoncxx::types::b_document{options.view()}
            << "isActive" << job.isActive
            << "status" << jobStatusToString(job.status)
            << "createdAt" << timePointToBsonDate(job.createdAt)
            << "updatedAt" << timePointToBsonDate(job.updatedAt);

    if (job.templateId) {
        builder << "templateId" << *job.templateId;
    }
    if (job.credentialId) {
        builder << "credentialId" << *job.credentialId;
    }
    if (job.lastRun) {
        builder << "lastRun" << timePointToBsonDate(*job.lastRun);
    }
    if (job.nextRun) {
        builder << "nextRun" << timePointToBsonDate(*job.nextRun);
    }
    return builder << finalize;
}

CrawlJob MongoRecordStore::bsonToCrawlJob(const bsoncxx::document::view& doc) const {
    CrawlJob job;
    job.id = getString(doc, "_id");
    job.tenantId = getString(doc, "tenantId");
    job.name = getString(doc, "name");
    job.baseUrl = getString(doc, "baseUrl");
    job.schedule = getString(doc, "schedule");
    job.templateId = getOptionalString(doc, "templateId");
    job.includePatterns = getStringArray(doc, "includePatterns");
    job.excludePatterns = getStringArray(doc, "excludePatterns");
    job.maxDepth = static_cast<int>(getInt(doc, "maxDepth", 2));
    job.maxPages = static_cast<int>(getInt(doc, "maxPages", 100));
    job.options = getJson(doc, "options");
    if (job.options.is_discarded()) {
        LOG_WARNING("Job " + job.id + " has unreadable options; using defaults");
        job.options = nlohmann::json::object();
    }
    job.credentialId = getOptionalString(doc, "credentialId");
    job.isActive = getBool(doc, "isActive", true);
    job.status = jobStatusFromString(getString(doc, "status", "idle"));
    job.lastRun = getDate(doc, "lastRun");
    job.nextRun = getDate(doc, "nextRun");
    job.createdAt = getDate(doc, "createdAt").value_or(TimePoint{});
    job.updatedAt = getDate(doc, "updatedAt").value_or(TimePoint{});
    return job;
}

bsoncxx::document::value MongoRecordStore::jobRunToBson(const JobRun& run) const {
    bsoncxx::builder::basic::array logs;
    for (const auto& entry : run.logs) {
        auto item = document{};
        item << "url" << entry.url << "error" << entry.error;
        if (entry.needsCredentials) {
            item << "needsCredentials" << *entry.needsCredentials;
        }
        if (entry.loginMethod) {
            item << "loginMethod" << *entry.loginMethod;
        }
        logs.append(item << finalize);
    }
    auto logsValue = logs.extract();

    auto builder = document{};
    builder << "_id" << run.id
            << "jobId" << run.jobId
            << "tenantId" << run.tenantId
            << "startedAt" << timePointToBsonDate(run.startedAt)
            << "status" << runStatusToString(run.status)
            << "urlsProcessed" << run.urlsProcessed
            << "urlsSuccessful" << run.urlsSuccessful
            << "urlsFailed" << run.urlsFailed
            << "documentsCreated" << run.documentsCreated
            << "documentsUpdated" << run.documentsUpdated
            << "changesDetected" << run.changesDetected
            << "logs" << bsoncxx::types::b_array{logsValue.view()};
    if (run.completedAt) {
        builder << "completedAt" << timePointToBsonDate(*run.completedAt);
    }
    if (run.errorMessage) {
        builder << "errorMessage" << *run.errorMessage;
    }
    return builder << finalize;
}

JobRun MongoRecordStore::bsonToJobRun(const bsoncxx::document::view& doc) const {
    JobRun run;
    run.id = getString(doc, "_id");
    run.jobId = getString(doc, "jobId");
    run.tenantId = getString(doc, "tenantId");
    run.startedAt = getDate(doc, "startedAt").value_or(TimePoint{});
    run.completedAt = getDate(doc, "completedAt");
    run.status = runStatusFromString(getString(doc, "status", "running"));
    run.urlsProcessed = static_cast<int>(getInt(doc, "urlsProcessed"));
    run.urlsSuccessful = static_cast<int>(getInt(doc, "urlsSuccessful"));
    run.urlsFailed = static_cast<int>(getInt(doc, "urlsFailed"));
    run.documentsCreated = static_cast<int>(getInt(doc, "documentsCreated"));
    run.documentsUpdated = static_cast<int>(getInt(doc, "documentsUpdated"));
    run.changesDetected = static_cast<int>(getInt(doc, "changesDetected"));
    run.errorMessage = getOptionalString(doc, "errorMessage");

    auto logs = doc["logs"];
    if (logs && logs.type() == bsoncxx::type::k_array) {
        for (const auto& item : logs.get_array().value) {
            if (item.type() != bsoncxx::type::k_document) continue;
            auto entryDoc = item.get_document().value;
            RunLogEntry entry;
            entry.url = getString(entryDoc, "url");
            entry.error = getString(entryDoc, "error");
            if (entryDoc["needsCredentials"]) {
                entry.needsCredentials = getBool(entryDoc, "needsCredentials", false);
            }
            entry.loginMethod = getOptionalString(entryDoc, "loginMethod");
            run.logs.push_back(std::move(entry));
        }
    }
    return run;
}

bsoncxx::document::value MongoRecordStore::documentToBson(const VersionedDocument& versioned) const {
    auto metadata = jsonToBson(versioned.metadata);
    auto builder = document{};
    builder << "_id" << versioned.id
            << "tenantId" << versioned.tenantId
            << "url" << versioned.url
            << "title" << versioned.title
            << "content" << versioned.content
            << "contentHash" << versioned.contentHash
            << "metadata" << bsoncxx::types::b_document{metadata.view()}
            << "wordCount" << static_cast<int64_t>(versioned.wordCount)
            << "version" << versioned.version
            << "isActive" << versioned.isActive
            << "createdAt" << timePointToBsonDate(versioned.createdAt)
            << "updatedAt" << timePointToBsonDate(versioned.updatedAt);
    if (versioned.jobId) {
        builder << "jobId" << *versioned.jobId;
    }
    return builder << finalize;
}

VersionedDocument MongoRecordStore::bsonToDocument(const bsoncxx::document::view& doc) const {
    VersionedDocument versioned;
    versioned.id = getString(doc, "_id");
    versioned.tenantId = getString(doc, "tenantId");
    versioned.url = getString(doc, "url");
    versioned.title = getString(doc, "title");
    versioned.content = getString(doc, "content");
    versioned.contentHash = getString(doc, "contentHash");
    versioned.metadata = getJson(doc, "metadata");
    if (versioned.metadata.is_discarded()) {
        versioned.metadata = nlohmann::json::object();
    }
    versioned.wordCount = static_cast<size_t>(getInt(doc, "wordCount"));
    versioned.version = static_cast<int>(getInt(doc, "version", 1));
    versioned.isActive = getBool(doc, "isActive", false);
    versioned.jobId = getOptionalString(doc, "jobId");
    versioned.createdAt = getDate(doc, "createdAt").value_or(TimePoint{});
    versioned.updatedAt = getDate(doc, "updatedAt").value_or(TimePoint{});
    return versioned;
}

bsoncxx::document::value MongoRecordStore::changeToBson(const ChangeRecord& change) const {
    auto builder = document{};
    builder << "_id" << change.id
            << "documentId" << change.documentId
            << "tenantId" << change.tenantId
            << "url" << change.url
            << "changeType" << changeTypeToString(change.changeType)
            << "newContentHash" << change.newContentHash
            << "changePercentage" << change.changePercentage
            << "summary" << change.summary
            << "detectedAt" << timePointToBsonDate(change.detectedAt);
    if (change.jobRunId) {
        builder << "jobRunId" << *change.jobRunId;
    }
    if (change.oldContentHash) {
        builder << "oldContentHash" << *change.oldContentHash;
    }
    return builder << finalize;
}

ChangeRecord MongoRecordStore::bsonToChange(const bsoncxx::document::view& doc) const {
    ChangeRecord change;
    change.id = getString(doc, "_id");
    change.documentId = getString(doc, "documentId");
    change.tenantId = getString(doc, "tenantId");
    change.url = getString(doc, "url");
    change.jobRunId = getOptionalString(doc, "jobRunId");
    change.changeType = changeTypeFromString(getString(doc, "changeType", "created"));
    change.oldContentHash = getOptionalString(doc, "oldContentHash");
    change.newContentHash = getString(doc, "newContentHash");
    change.changePercentage = getDouble(doc, "changePercentage");
    change.summary = getString(doc, "summary");
    change.detectedAt = getDate(doc, "detectedAt").value_or(TimePoint{});
    return change;
}

bsoncxx::document::value MongoRecordStore::credentialToBson(const CredentialDescriptor& credential) const {
    return document{} << "_id" << credential.id
                      << "tenantId" << credential.tenantId
                      << "name" << credential.name
                      << "domain" << credential.domain
                      << "authType" << auth::authKindToString(credential.kind)
                      << "encryptedPayload" << credential.encryptedPayload
                      << "createdAt" << timePointToBsonDate(credential.createdAt)
                      << finalize;
}

CredentialDescriptor MongoRecordStore::bsonToCredential(const bsoncxx::document::view& doc) const {
    CredentialDescriptor credential;
    credential.id = getString(doc, "_id");
    credential.tenantId = getString(doc, "tenantId");
    credential.name = getString(doc, "name");
    credential.domain = getString(doc, "domain");
    const std::string kind = getString(doc, "authType");
    auto parsedKind = auth::authKindFromString(kind);
    if (!parsedKind) {
        throw std::invalid_argument("Credential " + credential.id + " has unknown auth type '" + kind + "'");
    }
    credential.kind = *parsedKind;
    credential.encryptedPayload = getString(doc, "encryptedPayload");
    credential.createdAt = getDate(doc, "createdAt").value_or(TimePoint{});
    return credential;
}

// ---------------------------------------------------------------------------
// Jobs

Result<std::vector<CrawlJob>> MongoRecordStore::listActiveJobs() {
    LOG_DEBUG("MongoRecordStore::listActiveJobs called");
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        std::vector<CrawlJob> jobs;
        auto cursor = jobsCollection_.find((document{} << "isActive" << true << finalize).view());
        for (const auto& doc : cursor) {
            jobs.push_back(bsonToCrawlJob(doc));
        }
        LOG_INFO("Loaded " + std::to_string(jobs.size()) + " active crawl jobs");
        return Result<std::vector<CrawlJob>>::Success(std::move(jobs), "Active jobs loaded");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error listing active jobs: " + std::string(e.what()));
        return Result<std::vector<CrawlJob>>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<CrawlJob> MongoRecordStore::getJob(const std::string& jobId) {
    LOG_DEBUG("MongoRecordStore::getJob called for: " + jobId);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto doc = jobsCollection_.find_one((document{} << "_id" << jobId << finalize).view());
        if (!doc) {
            return Result<CrawlJob>::Failure("Crawl job not found: " + jobId);
        }
        return Result<CrawlJob>::Success(bsonToCrawlJob(doc->view()), "Crawl job found");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error loading job " + jobId + ": " + std::string(e.what()));
        return Result<CrawlJob>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<bool> MongoRecordStore::saveJob(const CrawlJob& job) {
    LOG_DEBUG("MongoRecordStore::saveJob called for: " + job.id);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        mongocxx::options::replace options;
        options.upsert(true);
        jobsCollection_.replace_one((document{} << "_id" << job.id << finalize).view(),
                                    crawlJobToBson(job).view(), options);
        LOG_INFO("Crawl job saved: " + job.id);
        return Result<bool>::Success(true, "Crawl job saved");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error saving job " + job.id + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<bool> MongoRecordStore::updateJobStatus(const std::string& jobId,
                                               JobStatus status,
                                               const std::optional<TimePoint>& lastRun,
                                               const std::optional<TimePoint>& nextRun) {
    LOG_DEBUG("MongoRecordStore::updateJobStatus " + jobId + " -> " + jobStatusToString(status));
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto fields = document{};
        fields << "status" << jobStatusToString(status)
               << "updatedAt" << timePointToBsonDate(std::chrono::system_clock::now());
        if (lastRun) {
            fields << "lastRun" << timePointToBsonDate(*lastRun);
        }
        if (nextRun) {
            fields << "nextRun" << timePointToBsonDate(*nextRun);
        }
        auto setFields = fields << finalize;
        auto update = document{} << "$set" << bsoncxx::types::b_document{setFields.view()} << finalize;

        auto result = jobsCollection_.update_one((document{} << "_id" << jobId << finalize).view(), update.view());
        if (!result || result->matched_count() == 0) {
            return Result<bool>::Failure("Crawl job not found: " + jobId);
        }
        return Result<bool>::Success(true, "Job status updated");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error updating job " + jobId + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<bool> MongoRecordStore::tryMarkJobRunning(const std::string& jobId,
                                                 TimePoint startedAt,
                                                 TimePoint staleBefore) {
    LOG_DEBUG("MongoRecordStore::tryMarkJobRunning called for: " + jobId);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        const std::string running = jobStatusToString(JobStatus::RUNNING);
        auto filter = document{} << "_id" << jobId
                                 << "$or" << open_array
                                     << open_document << "status" << open_document << "$ne" << running << close_document << close_document
                                     << open_document << "lastRun" << open_document << "$lt" << timePointToBsonDate(staleBefore) << close_document << close_document
                                 << close_array
                                 << finalize;
        auto update = document{} << "$set" << open_document
                                     << "status" << running
                                     << "lastRun" << timePointToBsonDate(startedAt)
                                     << "updatedAt" << timePointToBsonDate(std::chrono::system_clock::now())
                                 << close_document
                                 << finalize;

        auto claimed = jobsCollection_.find_one_and_update(filter.view(), update.view());
        if (claimed) {
            return Result<bool>::Success(true, "Job claimed");
        }

        auto existing = jobsCollection_.find_one((document{} << "_id" << jobId << finalize).view());
        if (!existing) {
            return Result<bool>::Failure("Crawl job not found: " + jobId);
        }
        LOG_INFO("Job " + jobId + " is held by another run");
        return Result<bool>::Success(false, "Job is already running");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error claiming job " + jobId + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

// ---------------------------------------------------------------------------
// Runs

Result<std::string> MongoRecordStore::createRun(const JobRun& run) {
    LOG_DEBUG("MongoRecordStore::createRun called for job: " + run.jobId);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto result = runsCollection_.insert_one(jobRunToBson(run).view());
        if (!result) {
            return Result<std::string>::Failure("Failed to insert job run");
        }
        LOG_INFO("Job run created: " + run.id + " for job " + run.jobId);
        return Result<std::string>::Success(run.id, "Job run created");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error creating run for job " + run.jobId + ": " + std::string(e.what()));
        return Result<std::string>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<bool> MongoRecordStore::finishRun(const JobRun& run) {
    LOG_DEBUG("MongoRecordStore::finishRun " + run.id + " -> " + runStatusToString(run.status));
    if (run.status == RunStatus::RUNNING) {
        return Result<bool>::Failure("A run can only finish as completed or failed");
    }
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        // Only a run that is still running may be finished
        auto filter = document{} << "_id" << run.id << "status" << runStatusToString(RunStatus::RUNNING) << finalize;
        auto result = runsCollection_.replace_one(filter.view(), jobRunToBson(run).view());
        if (!result || result->matched_count() == 0) {
            return Result<bool>::Failure("Job run " + run.id + " is not running");
        }
        LOG_INFO("Job run " + run.id + " finished as " + runStatusToString(run.status));
        return Result<bool>::Success(true, "Job run finished");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error finishing run " + run.id + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<JobRun> MongoRecordStore::getRun(const std::string& runId) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto doc = runsCollection_.find_one((document{} << "_id" << runId << finalize).view());
        if (!doc) {
            return Result<JobRun>::Failure("Job run not found: " + runId);
        }
        return Result<JobRun>::Success(bsonToJobRun(doc->view()), "Job run found");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error loading run " + runId + ": " + std::string(e.what()));
        return Result<JobRun>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<std::vector<JobRun>> MongoRecordStore::listRuns(const std::string& jobId, int limit) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        mongocxx::options::find options;
        options.sort((document{} << "startedAt" << -1 << finalize).view());
        options.limit(limit);
        std::vector<JobRun> runs;
        auto cursor = runsCollection_.find((document{} << "jobId" << jobId << finalize).view(), options);
        for (const auto& doc : cursor) {
            runs.push_back(bsonToJobRun(doc));
        }
        return Result<std::vector<JobRun>>::Success(std::move(runs), "Job runs loaded");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error listing runs for job " + jobId + ": " + std::string(e.what()));
        return Result<std::vector<JobRun>>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

// ---------------------------------------------------------------------------
// Credentials

Result<CredentialDescriptor> MongoRecordStore::getCredential(const std::string& credentialId) {
    LOG_DEBUG("MongoRecordStore::getCredential called for: " + credentialId);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto doc = credentialsCollection_.find_one((document{} << "_id" << credentialId << finalize).view());
        if (!doc) {
            return Result<CredentialDescriptor>::Failure("Credential not found: " + credentialId);
        }
        return Result<CredentialDescriptor>::Success(bsonToCredential(doc->view()), "Credential found");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error loading credential " + credentialId + ": " + std::string(e.what()));
        return Result<CredentialDescriptor>::Failure("MongoDB error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(e.what());
        return Result<CredentialDescriptor>::Failure(e.what());
    }
}

Result<bool> MongoRecordStore::saveCredential(const CredentialDescriptor& credential) {
    LOG_DEBUG("MongoRecordStore::saveCredential called for: " + credential.id);
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        mongocxx::options::replace options;
        options.upsert(true);
        credentialsCollection_.replace_one((document{} << "_id" << credential.id << finalize).view(),
                                           credentialToBson(credential).view(), options);
        LOG_INFO("Credential saved: " + credential.id + " (" + auth::authKindToString(credential.kind) + ")");
        return Result<bool>::Success(true, "Credential saved");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error saving credential " + credential.id + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

// ---------------------------------------------------------------------------
// Versioned documents

Result<std::optional<VersionedDocument>> MongoRecordStore::getActiveDocument(const std::string& tenantId,
                                                                             const std::string& url) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto filter = document{} << "tenantId" << tenantId << "url" << url << "isActive" << true << finalize;
        auto doc = documentsCollection_.find_one(filter.view());
        if (!doc) {
            return Result<std::optional<VersionedDocument>>::Success(std::nullopt, "No active document");
        }
        return Result<std::optional<VersionedDocument>>::Success(bsonToDocument(doc->view()), "Active document found");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error loading document " + url + ": " + std::string(e.what()));
        return Result<std::optional<VersionedDocument>>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<std::vector<VersionedDocument>> MongoRecordStore::listDocumentVersions(const std::string& tenantId,
                                                                              const std::string& url) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        mongocxx::options::find options;
        options.sort((document{} << "version" << 1 << finalize).view());
        std::vector<VersionedDocument> versions;
        auto cursor = documentsCollection_.find(
            (document{} << "tenantId" << tenantId << "url" << url << finalize).view(), options);
        for (const auto& doc : cursor) {
            versions.push_back(bsonToDocument(doc));
        }
        return Result<std::vector<VersionedDocument>>::Success(std::move(versions), "Document versions loaded");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error listing versions of " + url + ": " + std::string(e.what()));
        return Result<std::vector<VersionedDocument>>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<bool> MongoRecordStore::commitVersion(const VersionedDocument& versioned,
                                             const std::optional<std::string>& previousVersionId,
                                             const ChangeRecord& change) {
    LOG_DEBUG("MongoRecordStore::commitVersion " + versioned.url + " v" + std::to_string(versioned.version));
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        auto documentBson = documentToBson(versioned);
        auto changeBson = changeToBson(change);
        auto session = client_->start_session();

        session.with_transaction([&](mongocxx::client_session* s) {
            if (previousVersionId) {
                // Deactivate first so the one-active-version index holds
                auto filter = document{} << "_id" << *previousVersionId << "isActive" << true << finalize;
                auto update = document{} << "$set" << open_document
                                         << "isActive" << false
                                         << "updatedAt" << timePointToBsonDate(versioned.createdAt)
                                         << close_document << finalize;
                auto result = documentsCollection_.update_one(*s, filter.view(), update.view());
                if (!result || result->modified_count() == 0) {
                    throw std::runtime_error("Version " + *previousVersionId + " is no longer the active version");
                }
            }
            documentsCollection_.insert_one(*s, documentBson.view());
            changesCollection_.insert_one(*s, changeBson.view());
        });

        LOG_INFO("Committed version " + std::to_string(versioned.version) + " of " + versioned.url +
                 " (" + changeTypeToString(change.changeType) + ")");
        return Result<bool>::Success(true, "Version committed");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error committing version of " + versioned.url + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    } catch (const std::runtime_error& e) {
        LOG_WARNING("Version commit of " + versioned.url + " aborted: " + std::string(e.what()));
        return Result<bool>::Failure(e.what());
    }
}

Result<bool> MongoRecordStore::updateDocumentEmbedding(const std::string& documentId,
                                                       const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        bsoncxx::builder::basic::array vector;
        for (float value : embedding) {
            vector.append(static_cast<double>(value));
        }
        auto vectorValue = vector.extract();
        auto update = document{} << "$set" << open_document
                                 << "embedding" << bsoncxx::types::b_array{vectorValue.view()}
                                 << close_document << finalize;
        auto result = documentsCollection_.update_one((document{} << "_id" << documentId << finalize).view(),
                                                      update.view());
        if (!result || result->matched_count() == 0) {
            return Result<bool>::Failure("Document not found: " + documentId);
        }
        return Result<bool>::Success(true, "Embedding stored");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error storing embedding for " + documentId + ": " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB error: " + std::string(e.what()));
    }
}

Result<std::vector<ChangeRecord>> MongoRecordStore::listChanges(const std::string& tenantId, const std::string& url) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    try {
        mongocxx::options::find options;
        options.sort((document{} << "detectedAt" << 1 << finalize).view());
        std::vector<ChangeRecord> changes;
        auto cursor = changesCollection_.find(
            (document{} << "tenantId" << tenantId << "url" << url << finalize).view(), options);
        for (const auto& doc : cursor) {
            changes.push_back(bsonToChange(doc));
        }
        return Result<std::vector<ChangeRecord>>::Success(std::move(changes), "Change records loaded");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB error listing changes of " + url + ": " + std::string(e.what()));
        return Result<std::vector<ChangeRecord>>::Failure("MongoDB error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<std::vector<ChangeRecord>>::Failure(e.what());
    }
}

} // namespace sitewatch::storage
