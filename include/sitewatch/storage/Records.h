#pragma once

#include "../auth/AuthConfig.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sitewatch::storage {

using TimePoint = std::chrono::system_clock::time_point;

enum class JobStatus {
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED
};

enum class RunStatus {
    RUNNING,
    COMPLETED,
    FAILED
};

enum class ChangeType {
    CREATED,
    UPDATED,
    DELETED,
    TITLE_CHANGED,
    CONTENT_CHANGED
};

std::string jobStatusToString(JobStatus status);
JobStatus jobStatusFromString(const std::string& status);

std::string runStatusToString(RunStatus status);
RunStatus runStatusFromString(const std::string& status);

std::string changeTypeToString(ChangeType type);
ChangeType changeTypeFromString(const std::string& type);

// A recurring crawl of one site.
struct CrawlJob {
    std::string id;
    std::string tenantId;
    std::string name;
    std::string baseUrl;
    std::string schedule;                      // 5-field cron expression
    std::optional<std::string> templateId;
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    int maxDepth = 2;
    int maxPages = 100;
    nlohmann::json options = nlohmann::json::object();
    std::optional<std::string> credentialId;
    bool isActive = true;
    JobStatus status = JobStatus::IDLE;
    std::optional<TimePoint> lastRun;
    std::optional<TimePoint> nextRun;
    TimePoint createdAt{};
    TimePoint updatedAt{};
};

// One line of a run's error log.
struct RunLogEntry {
    std::string url;
    std::string error;
    std::optional<bool> needsCredentials;
    std::optional<std::string> loginMethod;
};

// Audit record of one execution of a CrawlJob. Status only moves from
// RUNNING to COMPLETED or FAILED.
struct JobRun {
    std::string id;
    std::string jobId;
    std::string tenantId;
    TimePoint startedAt{};
    std::optional<TimePoint> completedAt;
    RunStatus status = RunStatus::RUNNING;
    int urlsProcessed = 0;
    int urlsSuccessful = 0;
    int urlsFailed = 0;
    int documentsCreated = 0;
    int documentsUpdated = 0;
    int changesDetected = 0;
    std::vector<RunLogEntry> logs;
    std::optional<std::string> errorMessage;
};

// One version of a crawled page. Exactly one version per (tenant, url) is active.
struct VersionedDocument {
    std::string id;
    std::string tenantId;
    std::string url;
    std::string title;
    std::string content;
    std::string contentHash;
    nlohmann::json metadata = nlohmann::json::object();
    size_t wordCount = 0;
    int version = 1;
    bool isActive = true;
    std::optional<std::string> jobId;
    TimePoint createdAt{};
    TimePoint updatedAt{};
};

struct ChangeRecord {
    std::string id;
    std::string documentId;
    std::string tenantId;
    std::string url;
    std::optional<std::string> jobRunId;
    ChangeType changeType = ChangeType::CREATED;
    std::optional<std::string> oldContentHash;
    std::string newContentHash;
    double changePercentage = 0.0;
    std::string summary;
    TimePoint detectedAt{};
};

// Stored credential; the payload is only ever decrypted inside a run.
struct CredentialDescriptor {
    std::string id;
    std::string tenantId;
    std::string name;
    std::string domain;
    auth::AuthKind kind = auth::AuthKind::BASIC;
    std::string encryptedPayload;
    TimePoint createdAt{};
};

} // namespace sitewatch::storage
