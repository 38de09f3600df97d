#pragma once

#include "CronExpression.h"
#include "CrawlRunner.h"
#include "../auth/CredentialCipher.h"
#include "../common/CancellationToken.h"
#include "../common/Result.h"
#include "../crawler/templates/TemplateCatalog.h"
#include "../storage/RecordStore.h"
#include "../versioning/DocumentVersioner.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sitewatch::scheduler {

struct SchedulerOptions {
    int workers = 4;
    // Operator secret for stored credentials; without it credentialed jobs fail
    std::optional<std::string> credentialEncryptionKey;
    // A RUNNING job whose run started longer ago than this is treated as
    // abandoned by a crashed process and may be claimed again
    std::chrono::seconds runLeaseTimeout{std::chrono::hours(6)};
};

struct SchedulerStatus {
    bool initialized = false;
    size_t scheduledCount = 0;
    std::vector<std::string> scheduledJobIds;
    std::vector<std::string> runningJobIds;
};

// Save-time check of a job definition. Returns the reason the job cannot be
// scheduled, or nullopt when it is valid.
std::optional<std::string> validateCrawlJob(const storage::CrawlJob& job,
                                            const crawler::templates::TemplateCatalog& catalog);

// Owns the trigger registry for recurring crawl jobs and executes their runs.
//
// A timer thread wakes at the earliest due trigger and queues the job for a
// fixed pool of worker threads. Different jobs run concurrently; a job never
// has more than one run in flight, and a second execution attempt while one
// is running is rejected.
class JobScheduler {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    JobScheduler(std::shared_ptr<storage::RecordStore> store,
                 std::shared_ptr<CrawlRunner> runner,
                 std::shared_ptr<versioning::DocumentVersioner> versioner,
                 std::shared_ptr<const crawler::templates::TemplateCatalog> catalog,
                 SchedulerOptions options = SchedulerOptions());
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Registers every active job and starts the timer and worker threads.
    // Jobs with an invalid definition are logged and skipped. Returns the
    // number of jobs scheduled; fails only when the job list cannot be read.
    Result<size_t> initialize();

    // Replaces any trigger already registered for the job. Returns false for
    // inactive or invalid jobs, which end up unscheduled.
    bool scheduleJob(const storage::CrawlJob& job);
    bool unscheduleJob(const std::string& jobId);

    // Runs the job now on the calling thread and returns the finished run.
    // Inactive jobs are a no-op (empty value); a job that already has a run in
    // flight is rejected with a failed Result.
    Result<std::optional<storage::JobRun>> executeJob(const std::string& jobId);

    // Asks the job's in-flight run to stop. Returns false when nothing is running.
    bool cancelJob(const std::string& jobId);

    // Drops all triggers and registers the active jobs again.
    Result<size_t> reloadJobs();

    SchedulerStatus getStatus() const;

    std::optional<TimePoint> nextFireTime(const std::string& jobId) const;

    // Job ids whose trigger is due at `now`; their triggers move on to the
    // next matching minute.
    std::vector<std::string> takeDueJobs(TimePoint now);

    // Stops the threads, cancels in-flight runs and clears the registry.
    // Safe to call more than once.
    void shutdown();

private:
    struct Trigger {
        CronExpression cron;
        TimePoint nextFire;
    };

    void timerLoop();
    void workerLoop();
    void enqueue(const std::string& jobId);

    std::optional<auth::AuthConfig> resolveCredential(const storage::CrawlJob& job) const;
    std::optional<TimePoint> computeNextRun(const storage::CrawlJob& job, TimePoint after) const;
    void recordCrawl(const storage::CrawlJob& job,
                     const crawler::CrawlResult& result,
                     storage::JobRun& run);

    std::shared_ptr<storage::RecordStore> store_;
    std::shared_ptr<CrawlRunner> runner_;
    std::shared_ptr<versioning::DocumentVersioner> versioner_;
    std::shared_ptr<const crawler::templates::TemplateCatalog> catalog_;
    SchedulerOptions options_;
    std::unique_ptr<auth::CredentialCipher> cipher_;

    mutable std::mutex triggersMutex_;
    std::map<std::string, Trigger> triggers_;
    std::condition_variable timerCv_;
    bool triggersChanged_ = false;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<std::string> pending_;
    std::set<std::string> pendingIds_;

    mutable std::mutex runningMutex_;
    std::map<std::string, common::CancellationToken> running_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopping_{false};
    std::thread timerThread_;
    std::vector<std::thread> workers_;
    std::mutex lifecycleMutex_;
};

} // namespace sitewatch::scheduler
