#include "../../include/sitewatch/scheduler/JobScheduler.h"
#include "../../include/sitewatch/crawler/CrawlLogger.h"
#include "../../include/sitewatch/crawler/UrlPatternSet.h"
#include "../../include/sitewatch/common/IdGenerator.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace sitewatch::scheduler {

namespace {

const char* const kCancelledMessage = "Run cancelled by operator";

// Releases a job's in-flight slot when the run ends, however it ends.
class RunningSlot {
public:
    RunningSlot(std::mutex& mutex, std::map<std::string, common::CancellationToken>& running, std::string jobId)
        : mutex_(mutex), running_(running), jobId_(std::move(jobId)) {}

    ~RunningSlot() {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.erase(jobId_);
    }

    RunningSlot(const RunningSlot&) = delete;
    RunningSlot& operator=(const RunningSlot&) = delete;

private:
    std::mutex& mutex_;
    std::map<std::string, common::CancellationToken>& running_;
    std::string jobId_;
};

// A crawl that produced no page and failed on its seed URL did not run at all.
std::optional<std::string> seedFailure(const storage::CrawlJob& job, const crawler::CrawlResult& result) {
    if (!result.pages.empty()) return std::nullopt;
    const std::string seed = common::normalizeUrl(common::sanitizeUrl(job.baseUrl));
    for (const auto& error : result.errors) {
        if (common::normalizeUrl(error.url) == seed) {
            return error.error;
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> validateCrawlJob(const storage::CrawlJob& job,
                                            const crawler::templates::TemplateCatalog& catalog) {
    if (!common::isHttpUrl(common::sanitizeUrl(job.baseUrl))) {
        return "Invalid base URL: " + job.baseUrl;
    }
    try {
        CronExpression::parse(job.schedule).nextAfter(std::chrono::system_clock::now());
    } catch (const std::invalid_argument& e) {
        return "Invalid schedule: " + std::string(e.what());
    } catch (const std::runtime_error& e) {
        // Parses, but never fires
        return "Invalid schedule: " + std::string(e.what());
    }
    try {
        crawler::UrlPatternSet includes(job.includePatterns);
        crawler::UrlPatternSet excludes(job.excludePatterns);
    } catch (const std::invalid_argument& e) {
        return std::string(e.what());
    }
    if (job.templateId && *job.templateId != crawler::templates::kAutoTemplateId && !catalog.contains(*job.templateId)) {
        return "Unknown template: " + *job.templateId;
    }
    if (job.maxPages <= 0) {
        return "maxPages must be positive";
    }
    if (job.maxDepth < 0) {
        return "maxDepth must not be negative";
    }
    return std::nullopt;
}

JobScheduler::JobScheduler(std::shared_ptr<storage::RecordStore> store,
                           std::shared_ptr<CrawlRunner> runner,
                           std::shared_ptr<versioning::DocumentVersioner> versioner,
                           std::shared_ptr<const crawler::templates::TemplateCatalog> catalog,
                           SchedulerOptions options)
    : store_(std::move(store)),
      runner_(std::move(runner)),
      versioner_(std::move(versioner)),
      catalog_(std::move(catalog)),
      options_(std::move(options)) {
    if (!store_ || !runner_ || !versioner_ || !catalog_) {
        throw std::invalid_argument("JobScheduler requires a record store, crawl runner, versioner and template catalog");
    }
    if (options_.workers < 1) {
        options_.workers = 1;
    }
    if (options_.credentialEncryptionKey && !options_.credentialEncryptionKey->empty()) {
        cipher_ = std::make_unique<auth::CredentialCipher>(*options_.credentialEncryptionKey);
    }
}

JobScheduler::~JobScheduler() {
    shutdown();
}

Result<size_t> JobScheduler::initialize() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (initialized_) {
        LOG_WARNING("JobScheduler already initialized");
        return Result<size_t>::Success(getStatus().scheduledCount, "Already initialized");
    }

    auto jobs = store_->listActiveJobs();
    if (!jobs.success) {
        LOG_ERROR("Failed to load active jobs: " + jobs.message);
        return Result<size_t>::Failure("Failed to load active jobs: " + jobs.message);
    }

    stopping_ = false;
    size_t scheduled = 0;
    for (const auto& job : jobs.value) {
        if (scheduleJob(job)) {
            ++scheduled;
        }
    }

    timerThread_ = std::thread(&JobScheduler::timerLoop, this);
    workers_.reserve(options_.workers);
    for (int i = 0; i < options_.workers; ++i) {
        workers_.emplace_back(&JobScheduler::workerLoop, this);
    }
    initialized_ = true;

    LOG_INFO("JobScheduler initialized with " + std::to_string(scheduled) + " of " +
             std::to_string(jobs.value.size()) + " active jobs and " +
             std::to_string(options_.workers) + " workers");
    return Result<size_t>::Success(scheduled, "Scheduler initialized");
}

bool JobScheduler::scheduleJob(const storage::CrawlJob& job) {
    if (!job.isActive) {
        LOG_DEBUG("Job " + job.id + " is inactive, not scheduling");
        unscheduleJob(job.id);
        return false;
    }
    if (auto problem = validateCrawlJob(job, *catalog_)) {
        LOG_ERROR("Skipping job " + job.id + " (" + job.name + "): " + *problem);
        unscheduleJob(job.id);
        return false;
    }

    auto cron = CronExpression::parse(job.schedule);
    TimePoint nextFire;
    try {
        nextFire = cron.nextAfter(std::chrono::system_clock::now());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Skipping job " + job.id + ": " + std::string(e.what()));
        unscheduleJob(job.id);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(triggersMutex_);
        triggers_.insert_or_assign(job.id, Trigger{cron, nextFire});
        triggersChanged_ = true;
    }
    timerCv_.notify_all();

    if (job.status != storage::JobStatus::RUNNING) {
        auto updated = store_->updateJobStatus(job.id, job.status, job.lastRun, nextFire);
        if (!updated.success) {
            LOG_WARNING("Could not store next run for job " + job.id + ": " + updated.message);
        }
    }

    LOG_INFO("Scheduled job " + job.id + " (" + job.name + ") with '" + cron.text() + "'");
    return true;
}

bool JobScheduler::unscheduleJob(const std::string& jobId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(triggersMutex_);
        removed = triggers_.erase(jobId) > 0;
        triggersChanged_ = true;
    }
    timerCv_.notify_all();
    if (removed) {
        LOG_INFO("Unscheduled job " + jobId);
    }
    return removed;
}

Result<size_t> JobScheduler::reloadJobs() {
    auto jobs = store_->listActiveJobs();
    if (!jobs.success) {
        LOG_ERROR("Failed to reload jobs: " + jobs.message);
        return Result<size_t>::Failure("Failed to reload jobs: " + jobs.message);
    }

    {
        std::lock_guard<std::mutex> lock(triggersMutex_);
        triggers_.clear();
        triggersChanged_ = true;
    }

    size_t scheduled = 0;
    for (const auto& job : jobs.value) {
        if (scheduleJob(job)) {
            ++scheduled;
        }
    }
    LOG_INFO("Reloaded " + std::to_string(scheduled) + " jobs");
    return Result<size_t>::Success(scheduled, "Jobs reloaded");
}

SchedulerStatus JobScheduler::getStatus() const {
    SchedulerStatus status;
    status.initialized = initialized_;
    {
        std::lock_guard<std::mutex> lock(triggersMutex_);
        status.scheduledCount = triggers_.size();
        for (const auto& [jobId, trigger] : triggers_) {
            status.scheduledJobIds.push_back(jobId);
        }
    }
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        for (const auto& [jobId, token] : running_) {
            status.runningJobIds.push_back(jobId);
        }
    }
    return status;
}

std::optional<JobScheduler::TimePoint> JobScheduler::nextFireTime(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(triggersMutex_);
    auto it = triggers_.find(jobId);
    if (it == triggers_.end()) {
        return std::nullopt;
    }
    return it->second.nextFire;
}

std::vector<std::string> JobScheduler::takeDueJobs(TimePoint now) {
    std::vector<std::string> due;
    std::lock_guard<std::mutex> lock(triggersMutex_);
    for (auto it = triggers_.begin(); it != triggers_.end();) {
        if (it->second.nextFire > now) {
            ++it;
            continue;
        }
        due.push_back(it->first);
        try {
            it->second.nextFire = it->second.cron.nextAfter(now);
            ++it;
        } catch (const std::runtime_error& e) {
            LOG_ERROR("Dropping trigger for job " + it->first + ": " + std::string(e.what()));
            it = triggers_.erase(it);
        }
    }
    return due;
}

bool JobScheduler::cancelJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(runningMutex_);
    auto it = running_.find(jobId);
    if (it == running_.end()) {
        return false;
    }
    it->second.cancel();
    LOG_INFO("Cancellation requested for job " + jobId);
    return true;
}

void JobScheduler::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    {
        std::lock_guard<std::mutex> lock(triggersMutex_);
        stopping_ = true;
        triggers_.clear();
    }
    timerCv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        pending_.clear();
        pendingIds_.clear();
    }
    queueCv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        for (auto& [jobId, token] : running_) {
            token.cancel();
        }
    }

    if (timerThread_.joinable()) {
        timerThread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    if (initialized_.exchange(false)) {
        LOG_INFO("JobScheduler shut down");
    }
}

void JobScheduler::timerLoop() {
    LOG_DEBUG("Scheduler timer thread started");
    while (!stopping_) {
        for (const auto& jobId : takeDueJobs(std::chrono::system_clock::now())) {
            enqueue(jobId);
        }

        std::unique_lock<std::mutex> lock(triggersMutex_);
        // Wake at least once a minute so clock adjustments are picked up
        TimePoint wakeAt = std::chrono::system_clock::now() + std::chrono::minutes(1);
        for (const auto& [jobId, trigger] : triggers_) {
            wakeAt = std::min(wakeAt, trigger.nextFire);
        }
        timerCv_.wait_until(lock, wakeAt, [this] { return stopping_.load() || triggersChanged_; });
        triggersChanged_ = false;
    }
    LOG_DEBUG("Scheduler timer thread stopped");
}

void JobScheduler::enqueue(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_ || !pendingIds_.insert(jobId).second) {
            return;
        }
        pending_.push_back(jobId);
    }
    queueCv_.notify_one();
}

void JobScheduler::workerLoop() {
    while (true) {
        std::string jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] { return stopping_.load() || !pending_.empty(); });
            if (stopping_) {
                return;
            }
            jobId = pending_.front();
            pending_.pop_front();
            pendingIds_.erase(jobId);
        }

        auto result = executeJob(jobId);
        if (!result.success) {
            LOG_WARNING("Scheduled run of job " + jobId + " did not start: " + result.message);
        }
    }
}

std::optional<auth::AuthConfig> JobScheduler::resolveCredential(const storage::CrawlJob& job) const {
    if (!job.credentialId) {
        return std::nullopt;
    }

    auto credential = store_->getCredential(*job.credentialId);
    if (!credential.success) {
        throw std::runtime_error("Credential " + *job.credentialId + " could not be loaded: " + credential.message);
    }
    if (!cipher_) {
        throw std::runtime_error("CREDENTIAL_ENCRYPTION_KEY is not set; cannot decrypt credential " + *job.credentialId);
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(cipher_->decrypt(credential.value.encryptedPayload));
    } catch (const nlohmann::json::exception&) {
        throw std::invalid_argument("Credential " + *job.credentialId + " does not decrypt to a JSON object");
    }

    std::string domain = credential.value.domain.empty() ? common::extractHost(job.baseUrl)
                                                         : credential.value.domain;
    LOG_DEBUG("Resolved " + auth::authKindToString(credential.value.kind) + " credential " +
              *job.credentialId + " for job " + job.id);
    return auth::parseAuthConfig(credential.value.kind, payload, domain);
}

std::optional<JobScheduler::TimePoint> JobScheduler::computeNextRun(const storage::CrawlJob& job,
                                                                     TimePoint after) const {
    try {
        return CronExpression::parse(job.schedule).nextAfter(after);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot compute next run for job " + job.id + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

void JobScheduler::recordCrawl(const storage::CrawlJob& job,
                               const crawler::CrawlResult& result,
                               storage::JobRun& run) {
    run.urlsProcessed = static_cast<int>(result.summary.totalPages);
    run.urlsSuccessful = static_cast<int>(result.pages.size());
    run.urlsFailed = static_cast<int>(result.errors.size());

    for (const auto& error : result.errors) {
        storage::RunLogEntry entry;
        entry.url = error.url;
        entry.error = error.error;
        if (error.isAuthError || error.needsCredentials) {
            entry.needsCredentials = error.needsCredentials;
        }
        entry.loginMethod = error.loginMethod;
        run.logs.push_back(std::move(entry));
    }

    for (const auto& page : result.pages) {
        auto outcome = versioner_->versionPage(job.tenantId, page, job.id, run.id);
        if (!outcome.success) {
            LOG_ERROR("Versioning failed for " + page.url + ": " + outcome.message);
            run.logs.push_back(storage::RunLogEntry{page.url, "Versioning failed: " + outcome.message, std::nullopt, std::nullopt});
            continue;
        }
        switch (outcome.value.action) {
            case versioning::VersionAction::CREATED:
                ++run.documentsCreated;
                ++run.changesDetected;
                break;
            case versioning::VersionAction::UPDATED:
                ++run.documentsUpdated;
                ++run.changesDetected;
                crawler::CrawlLogger::broadcastSessionLog(run.id, "📝 Changed: " + page.url + " (" +
                                                          outcome.value.change->summary + ")");
                break;
            case versioning::VersionAction::UNCHANGED:
                break;
        }
    }
}

Result<std::optional<storage::JobRun>> JobScheduler::executeJob(const std::string& jobId) {
    using ExecuteResult = Result<std::optional<storage::JobRun>>;

    auto loaded = store_->getJob(jobId);
    if (!loaded.success) {
        LOG_ERROR("Cannot execute job " + jobId + ": " + loaded.message);
        return ExecuteResult::Failure("Job not found: " + jobId);
    }
    const storage::CrawlJob& job = loaded.value;
    if (!job.isActive) {
        LOG_INFO("Job " + jobId + " is inactive, skipping run");
        return ExecuteResult::Success(std::nullopt, "Job is inactive");
    }

    common::CancellationToken cancel;
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        if (!running_.emplace(jobId, cancel).second) {
            LOG_WARNING("Job " + jobId + " already has a run in progress");
            return ExecuteResult::Failure("Job " + jobId + " is already running");
        }
    }
    RunningSlot slot(runningMutex_, running_, jobId);

    storage::JobRun run;
    run.id = common::generateId();
    run.jobId = job.id;
    run.tenantId = job.tenantId;
    run.startedAt = std::chrono::system_clock::now();
    run.status = storage::RunStatus::RUNNING;

    // The store claim covers runs started by other processes sharing the store
    auto claimed = store_->tryMarkJobRunning(job.id, run.startedAt, run.startedAt - options_.runLeaseTimeout);
    if (!claimed.success) {
        LOG_ERROR("Could not mark job " + job.id + " running: " + claimed.message);
        return ExecuteResult::Failure("Could not mark job running: " + claimed.message);
    }
    if (!claimed.value) {
        LOG_WARNING("Job " + job.id + " is running in another process");
        return ExecuteResult::Failure("Job " + jobId + " is already running");
    }

    auto created = store_->createRun(run);
    if (!created.success) {
        LOG_ERROR("Could not create run for job " + job.id + ": " + created.message);
        auto reverted = store_->updateJobStatus(job.id, storage::JobStatus::FAILED, run.startedAt,
                                                computeNextRun(job, run.startedAt));
        if (!reverted.success) {
            LOG_ERROR("Could not mark job " + job.id + " failed: " + reverted.message);
        }
        return ExecuteResult::Failure("Could not create run: " + created.message);
    }

    LOG_INFO("Executing job " + job.id + " (" + job.name + "), run " + run.id);
    crawler::CrawlLogger::broadcastSessionLog(run.id, "🚀 Run started for " + job.baseUrl);

    try {
        auto credential = resolveCredential(job);
        crawler::CrawlResult result = runner_->run(job, credential, run.id, cancel);
        recordCrawl(job, result, run);

        if (cancel.isCancelled() || result.summary.cancelled) {
            run.status = storage::RunStatus::FAILED;
            run.errorMessage = kCancelledMessage;
        } else if (auto seedError = seedFailure(job, result)) {
            LOG_WARNING("Run " + run.id + " of job " + job.id + " failed on its seed URL: " + *seedError);
            run.status = storage::RunStatus::FAILED;
            run.errorMessage = *seedError;
        } else {
            run.status = storage::RunStatus::COMPLETED;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Run " + run.id + " of job " + job.id + " failed: " + std::string(e.what()));
        run.status = storage::RunStatus::FAILED;
        run.errorMessage = e.what();
    }

    run.completedAt = std::chrono::system_clock::now();
    auto finished = store_->finishRun(run);
    if (!finished.success) {
        LOG_ERROR("Could not finish run " + run.id + ": " + finished.message);
    }

    const bool completed = run.status == storage::RunStatus::COMPLETED;
    auto nextRun = computeNextRun(job, *run.completedAt);
    auto updated = store_->updateJobStatus(job.id,
                                           completed ? storage::JobStatus::COMPLETED : storage::JobStatus::FAILED,
                                           run.startedAt, nextRun);
    if (!updated.success) {
        LOG_ERROR("Could not update status of job " + job.id + ": " + updated.message);
    }

    if (completed) {
        LOG_INFO_STREAM("Run " << run.id << " completed: " << run.urlsSuccessful << "/" << run.urlsProcessed
                        << " pages, " << run.documentsCreated << " created, " << run.documentsUpdated
                        << " updated");
        crawler::CrawlLogger::broadcastSessionLog(run.id, "✅ Run completed: " + std::to_string(run.changesDetected) +
                                                  " changes detected");
    } else {
        crawler::CrawlLogger::broadcastSessionLog(run.id, "❌ Run failed: " + run.errorMessage.value_or(""), "error");
    }
    return ExecuteResult::Success(run, completed ? "Run completed" : "Run failed");
}

} // namespace sitewatch::scheduler
