#pragma once

#include "ChangeDetector.h"
#include "EmbeddingService.h"
#include "../common/Result.h"
#include "../crawler/models/ScrapedPage.h"
#include "../storage/RecordStore.h"

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sitewatch::versioning {

enum class VersionAction {
    CREATED,
    UPDATED,
    UNCHANGED
};

struct VersionOutcome {
    VersionAction action = VersionAction::UNCHANGED;
    std::optional<storage::VersionedDocument> document;  // the new version
    std::optional<storage::ChangeRecord> change;
};

// Decides whether a freshly scraped page becomes a new document version.
//
// No active version: version 1 and a "created" change record. An active
// version with the same content hash, or a diff below the threshold: nothing
// is written. Otherwise version + 1, the prior version deactivated and an
// "updated" change record, committed together.
class DocumentVersioner {
public:
    // `embeddings` may be null, in which case no embedding is attached.
    DocumentVersioner(std::shared_ptr<storage::RecordStore> store,
                      std::shared_ptr<EmbeddingService> embeddings,
                      ChangeDetector detector = ChangeDetector());

    Result<VersionOutcome> versionPage(const std::string& tenantId,
                                       const crawler::ScrapedPage& page,
                                       const std::optional<std::string>& jobId,
                                       const std::optional<std::string>& runId);

    const ChangeDetector& detector() const { return detector_; }

private:
    void attachEmbedding(const storage::VersionedDocument& document);

    std::shared_ptr<storage::RecordStore> store_;
    std::shared_ptr<EmbeddingService> embeddings_;
    ChangeDetector detector_;
};

// Page metadata as stored alongside a document version.
nlohmann::json pageMetadataToJson(const crawler::ScrapedPage& page);

} // namespace sitewatch::versioning
