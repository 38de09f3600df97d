#include "../include/sitewatch/auth/AuthErrorAdvisor.h"
#include "../include/sitewatch/auth/AuthenticationAdapter.h"
#include "../include/sitewatch/auth/LoginDetector.h"
#include "../include/sitewatch/common/Logger.h"
#include "../include/sitewatch/common/ServiceConfig.h"
#include "../include/sitewatch/crawler/CrawlLogger.h"
#include "../include/sitewatch/crawler/templates/TemplateCatalog.h"
#include "../include/sitewatch/crawler/templates/TemplateStorage.h"
#include "../include/sitewatch/scheduler/HttpCrawlRunner.h"
#include "../include/sitewatch/scheduler/JobScheduler.h"
#include "../include/sitewatch/storage/MongoRecordStore.h"
#include "../include/sitewatch/versioning/DocumentVersioner.h"
#include "../include/sitewatch/versioning/HttpEmbeddingClient.h"

#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <execinfo.h>
#include <iostream>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace sitewatch;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void requestStop(int) {
    g_stopRequested = 1;
}

// Logs a backtrace on crashes
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << "              run the scheduler daemon\n"
              << "       " << program << " run <jobId>  run one job now and exit\n";
}

// Routes per-run progress messages into the process log.
void installProgressSinks() {
    crawler::CrawlLogger::setLogBroadcastFunction([](const std::string& message, const std::string& level) {
        if (level == "error") {
            LOG_ERROR("[progress] " + message);
        } else if (level == "warning") {
            LOG_WARNING("[progress] " + message);
        } else {
            LOG_DEBUG("[progress] " + message);
        }
    });
    crawler::CrawlLogger::setRunLogBroadcastFunction(
        [](const std::string& runId, const std::string& message, const std::string& level) {
            if (level == "error") {
                LOG_ERROR("[run " + runId + "] " + message);
            } else {
                LOG_INFO("[run " + runId + "] " + message);
            }
        });
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();

    std::optional<std::string> runJobId;
    if (argc == 3 && std::string(argv[1]) == "run") {
        runJobId = argv[2];
    } else if (argc != 1) {
        printUsage(argv[0]);
        return 2;
    }

    const common::ServiceConfig config = common::ServiceConfig::fromEnvironment();
    common::Logger::getInstance().init(config.logLevel, true, config.logFile);
    LOG_INFO("============== SITEWATCH STARTING ==============");

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_ERROR("curl_global_init failed");
        return 1;
    }
    installProgressSinks();

    int exitCode = 0;
    try {
        auto catalog = std::make_shared<const crawler::templates::TemplateCatalog>(
            crawler::templates::loadTemplates(config.templatesPath));
        LOG_INFO("Template catalog ready with " + std::to_string(catalog->size()) + " templates");

        auto store = std::make_shared<storage::MongoRecordStore>(config.mongoUri, config.mongoDatabase);
        auto indexes = store->ensureIndexes();
        if (!indexes.success) {
            LOG_WARNING("Index setup incomplete: " + indexes.message);
        }

        auto detector = std::make_shared<const auth::HeuristicLoginDetector>();
        auto authentication = std::make_shared<const auth::AuthenticationAdapter>(detector);
        auto advisor = std::make_shared<const auth::AuthErrorAdvisor>(config.internalDomainSuffixes);

        std::shared_ptr<versioning::EmbeddingService> embeddings;
        if (config.embeddingServiceUrl) {
            embeddings = std::make_shared<versioning::HttpEmbeddingClient>(*config.embeddingServiceUrl,
                                                                           config.embeddingApiKey);
            LOG_INFO("Embedding service: " + *config.embeddingServiceUrl);
        } else {
            LOG_INFO("EMBEDDING_SERVICE_URL not set, document embeddings disabled");
        }
        auto versioner = std::make_shared<versioning::DocumentVersioner>(
            store, embeddings, versioning::ChangeDetector(config.changeThresholdPercent));

        auto runner = std::make_shared<scheduler::HttpCrawlRunner>(config, catalog, authentication, advisor);

        scheduler::SchedulerOptions options;
        options.workers = config.schedulerWorkers;
        options.credentialEncryptionKey = config.credentialEncryptionKey;
        if (!options.credentialEncryptionKey) {
            LOG_WARNING("CREDENTIAL_ENCRYPTION_KEY not set, jobs with credentials will fail");
        }
        scheduler::JobScheduler jobScheduler(store, runner, versioner, catalog, options);

        std::signal(SIGINT, requestStop);
        std::signal(SIGTERM, requestStop);

        if (runJobId) {
            // Ctrl-C during a one-off run cancels it
            std::atomic<bool> done{false};
            std::thread watcher([&] {
                while (!done) {
                    if (g_stopRequested) {
                        jobScheduler.cancelJob(*runJobId);
                        break;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
            });
            auto result = jobScheduler.executeJob(*runJobId);
            done = true;
            watcher.join();

            if (!result.success) {
                LOG_ERROR("Run not started: " + result.message);
                exitCode = 1;
            } else if (!result.value) {
                LOG_INFO(result.message);
            } else {
                const storage::JobRun& run = *result.value;
                std::cout << "run " << run.id << " " << storage::runStatusToString(run.status)
                          << ": processed=" << run.urlsProcessed << " successful=" << run.urlsSuccessful
                          << " failed=" << run.urlsFailed << " created=" << run.documentsCreated
                          << " updated=" << run.documentsUpdated << " changes=" << run.changesDetected
                          << std::endl;
                if (run.errorMessage) {
                    std::cout << "error: " << *run.errorMessage << std::endl;
                }
                exitCode = run.status == storage::RunStatus::COMPLETED ? 0 : 1;
            }
        } else {
            auto initialized = jobScheduler.initialize();
            if (!initialized.success) {
                LOG_ERROR("Scheduler failed to start: " + initialized.message);
                exitCode = 1;
            } else {
                LOG_INFO("Scheduler running with " + std::to_string(initialized.value) + " jobs");
                while (!g_stopRequested) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
                LOG_INFO("Stop requested, shutting down scheduler");
            }
        }
        jobScheduler.shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal startup error: " + std::string(e.what()));
        exitCode = 1;
    }

    curl_global_cleanup();
    LOG_INFO("============== SITEWATCH STOPPED ==============");
    common::Logger::getInstance().close();
    return exitCode;
}
