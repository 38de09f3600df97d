#include "../../include/sitewatch/versioning/DocumentVersioner.h"
#include "../../include/sitewatch/common/IdGenerator.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"

#include <stdexcept>

namespace sitewatch::versioning {

nlohmann::json pageMetadataToJson(const crawler::ScrapedPage& page) {
    const crawler::PageMetadata& m = page.metadata;
    nlohmann::json headings = nlohmann::json::array();
    for (const auto& heading : m.headings) {
        headings.push_back({{"level", heading.level}, {"text", heading.text}});
    }
    return {
        {"domain", m.domain},
        {"description", m.description},
        {"keywords", m.keywords},
        {"author", m.author},
        {"publishedDate", m.publishedDate},
        {"modifiedDate", m.modifiedDate},
        {"language", m.language},
        {"links", m.links},
        {"images", m.images},
        {"headings", headings},
        {"wordCount", m.wordCount},
        {"readingTime", m.readingTimeMinutes},
        {"depth", m.depth},
        {"parentUrl", m.parentUrl},
        {"contentType", m.contentType},
        {"authMethod", crawler::authMethodName(m.authMethod)},
        {"finalUrl", page.finalUrl},
        {"statusCode", page.statusCode}
    };
}

DocumentVersioner::DocumentVersioner(std::shared_ptr<storage::RecordStore> store,
                                     std::shared_ptr<EmbeddingService> embeddings,
                                     ChangeDetector detector)
    : store_(std::move(store)), embeddings_(std::move(embeddings)), detector_(detector) {
    if (!store_) {
        throw std::invalid_argument("DocumentVersioner requires a record store");
    }
}

Result<VersionOutcome> DocumentVersioner::versionPage(const std::string& tenantId,
                                                      const crawler::ScrapedPage& page,
                                                      const std::optional<std::string>& jobId,
                                                      const std::optional<std::string>& runId) {
    const std::string url = common::normalizeUrl(page.url);
    auto active = store_->getActiveDocument(tenantId, url);
    if (!active.success) {
        return Result<VersionOutcome>::Failure("Failed to load active version of " + url + ": " + active.message);
    }

    const auto now = std::chrono::system_clock::now();
    storage::VersionedDocument document;
    document.id = common::generateId();
    document.tenantId = tenantId;
    document.url = url;
    document.title = page.title;
    document.content = page.content;
    document.contentHash = page.contentHash;
    document.metadata = pageMetadataToJson(page);
    document.wordCount = page.metadata.wordCount;
    document.isActive = true;
    document.jobId = jobId;
    document.createdAt = now;
    document.updatedAt = now;

    storage::ChangeRecord change;
    change.id = common::generateId();
    change.documentId = document.id;
    change.tenantId = tenantId;
    change.url = url;
    change.jobRunId = runId;
    change.newContentHash = page.contentHash;
    change.detectedAt = now;

    VersionOutcome outcome;
    std::optional<std::string> previousId;
    const std::optional<storage::VersionedDocument>& prior = active.value;

    if (!prior) {
        document.version = 1;
        change.changeType = storage::ChangeType::CREATED;
        change.changePercentage = 100.0;
        change.summary = "New document: " + std::to_string(page.metadata.wordCount) + " words";
        outcome.action = VersionAction::CREATED;
    } else {
        if (prior->contentHash == page.contentHash) {
            LOG_DEBUG("Content unchanged for " + url + " (version " + std::to_string(prior->version) + ")");
            return Result<VersionOutcome>::Success(outcome, "Content unchanged");
        }
        ChangeAnalysis analysis = detector_.detectChange(prior->content, page.content);
        if (!analysis.isSignificant) {
            LOG_DEBUG("Change below threshold for " + url + ": " + std::to_string(analysis.changePercentage) + "%");
            return Result<VersionOutcome>::Success(outcome, "Change below threshold");
        }
        document.version = prior->version + 1;
        change.changeType = storage::ChangeType::UPDATED;
        change.oldContentHash = prior->contentHash;
        change.changePercentage = analysis.changePercentage;
        change.summary = analysis.summary;
        previousId = prior->id;
        outcome.action = VersionAction::UPDATED;
    }

    auto committed = store_->commitVersion(document, previousId, change);
    if (!committed.success) {
        return Result<VersionOutcome>::Failure("Failed to commit version " + std::to_string(document.version) +
                                               " of " + url + ": " + committed.message);
    }
    LOG_INFO("Document " + url + " " + storage::changeTypeToString(change.changeType) + " (version " +
             std::to_string(document.version) + ", " + change.summary + ")");

    // After the commit: an embedding failure leaves the version in place
    attachEmbedding(document);

    outcome.document = std::move(document);
    outcome.change = std::move(change);
    return Result<VersionOutcome>::Success(std::move(outcome), "Version committed");
}

void DocumentVersioner::attachEmbedding(const storage::VersionedDocument& document) {
    if (!embeddings_) {
        return;
    }
    auto embedding = embeddings_->embed(document.title + "\n\n" + document.content);
    if (!embedding.success) {
        LOG_WARNING("Embedding skipped for " + document.url + ": " + embedding.message);
        return;
    }
    auto stored = store_->updateDocumentEmbedding(document.id, embedding.value);
    if (!stored.success) {
        LOG_WARNING("Failed to store embedding for " + document.url + ": " + stored.message);
    }
}

} // namespace sitewatch::versioning
