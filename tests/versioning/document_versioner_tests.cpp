#include <catch2/catch_test_macros.hpp>
#include "../support/FakeEmbeddingService.h"
#include "../support/InMemoryRecordStore.h"
#include "../../include/sitewatch/common/Hashing.h"
#include "../../include/sitewatch/versioning/DocumentVersioner.h"

using namespace sitewatch;
using namespace sitewatch::versioning;
using sitewatch::testing::FakeEmbeddingService;
using sitewatch::testing::InMemoryRecordStore;

namespace {

crawler::ScrapedPage makePage(const std::string& url, const std::string& content) {
    crawler::ScrapedPage page;
    page.url = url;
    page.finalUrl = url;
    page.statusCode = 200;
    page.title = "Pricing";
    page.content = content;
    page.contentHash = common::sha256Hex(content);
    page.metadata.domain = "example.com";
    page.metadata.wordCount = 4;
    return page;
}

const std::string kOriginal =
    "Our plans start at ten dollars per month and include unlimited projects for every team member";
const std::string kRewritten =
    "Plans now start at twelve dollars per seat with a free tier for small teams and nonprofits";

} // namespace

TEST_CASE("DocumentVersioner - Version lifecycle", "[DocumentVersioner]") {
    auto store = std::make_shared<InMemoryRecordStore>();
    auto embeddings = std::make_shared<FakeEmbeddingService>();
    DocumentVersioner versioner(store, embeddings);

    auto first = versioner.versionPage("tenant-1", makePage("https://example.com/pricing", kOriginal),
                                       std::string("job-1"), std::string("run-1"));
    REQUIRE(first.success);
    REQUIRE(first.value.action == VersionAction::CREATED);
    REQUIRE(first.value.document->version == 1);
    REQUIRE(first.value.document->isActive);
    REQUIRE(first.value.document->jobId == std::optional<std::string>("job-1"));
    REQUIRE(first.value.change->changeType == storage::ChangeType::CREATED);
    REQUIRE(first.value.change->changePercentage == 100.0);
    REQUIRE(first.value.change->jobRunId == std::optional<std::string>("run-1"));
    REQUIRE(first.value.document->metadata["statusCode"] == 200);

    SECTION("Identical content writes nothing") {
        auto second = versioner.versionPage("tenant-1", makePage("https://example.com/pricing", kOriginal),
                                            std::nullopt, std::nullopt);
        REQUIRE(second.success);
        REQUIRE(second.value.action == VersionAction::UNCHANGED);
        REQUIRE_FALSE(second.value.document.has_value());
        REQUIRE(store->documentCount() == 1);
        REQUIRE(store->changeCount() == 1);
    }

    SECTION("Material change creates the next version") {
        auto third = versioner.versionPage("tenant-1", makePage("https://example.com/pricing", kRewritten),
                                           std::nullopt, std::string("run-3"));
        REQUIRE(third.success);
        REQUIRE(third.value.action == VersionAction::UPDATED);
        REQUIRE(third.value.document->version == 2);
        REQUIRE(third.value.change->changeType == storage::ChangeType::UPDATED);
        REQUIRE(third.value.change->oldContentHash == std::optional<std::string>(common::sha256Hex(kOriginal)));
        REQUIRE(third.value.change->changePercentage > 5.0);
        REQUIRE(third.value.change->changePercentage <= 100.0);

        auto versions = store->listDocumentVersions("tenant-1", "https://example.com/pricing");
        REQUIRE(versions.value.size() == 2);
        REQUIRE(versions.value[0].version == 1);
        REQUIRE_FALSE(versions.value[0].isActive);
        REQUIRE(versions.value[1].version == 2);
        REQUIRE(versions.value[1].isActive);

        auto changes = store->listChanges("tenant-1", "https://example.com/pricing");
        REQUIRE(changes.value.size() == 2);
    }

    SECTION("Change below the threshold writes nothing") {
        std::string longText;
        for (int i = 0; i < 100; ++i) longText += "word" + std::to_string(i) + " ";
        auto base = versioner.versionPage("tenant-1", makePage("https://example.com/long", longText),
                                          std::nullopt, std::nullopt);
        REQUIRE(base.value.action == VersionAction::CREATED);

        auto tweak = versioner.versionPage("tenant-1", makePage("https://example.com/long", longText + "extra"),
                                           std::nullopt, std::nullopt);
        REQUIRE(tweak.success);
        REQUIRE(tweak.value.action == VersionAction::UNCHANGED);
        REQUIRE(tweak.message == "Change below threshold");
    }

    SECTION("Embedding is attached to the new version") {
        REQUIRE(embeddings->calls == 1);
        REQUIRE(store->embeddingFor(first.value.document->id).has_value());
    }
}

TEST_CASE("DocumentVersioner - URL identity", "[DocumentVersioner]") {
    auto store = std::make_shared<InMemoryRecordStore>();
    DocumentVersioner versioner(store, nullptr);

    auto created = versioner.versionPage("tenant-1", makePage("https://example.com/docs/", kOriginal),
                                         std::nullopt, std::nullopt);
    REQUIRE(created.value.document->url == "https://example.com/docs");

    SECTION("Equivalent URLs share a document") {
        auto again = versioner.versionPage("tenant-1", makePage("https://example.com/docs#top", kOriginal),
                                           std::nullopt, std::nullopt);
        REQUIRE(again.value.action == VersionAction::UNCHANGED);
    }

    SECTION("Tenants are versioned separately") {
        auto other = versioner.versionPage("tenant-2", makePage("https://example.com/docs/", kOriginal),
                                           std::nullopt, std::nullopt);
        REQUIRE(other.value.action == VersionAction::CREATED);
        REQUIRE(other.value.document->version == 1);
    }
}

TEST_CASE("DocumentVersioner - Failures", "[DocumentVersioner]") {
    auto store = std::make_shared<InMemoryRecordStore>();
    auto embeddings = std::make_shared<FakeEmbeddingService>();
    DocumentVersioner versioner(store, embeddings);

    SECTION("Embedding failure keeps the version") {
        embeddings->fail = true;
        auto result = versioner.versionPage("tenant-1", makePage("https://example.com/a", kOriginal),
                                            std::nullopt, std::nullopt);
        REQUIRE(result.success);
        REQUIRE(result.value.action == VersionAction::CREATED);
        REQUIRE(store->documentCount() == 1);
        REQUIRE_FALSE(store->embeddingFor(result.value.document->id).has_value());
    }

    SECTION("Rejected commit writes nothing and reports failure") {
        store->failCommits = true;
        auto result = versioner.versionPage("tenant-1", makePage("https://example.com/a", kOriginal),
                                            std::nullopt, std::nullopt);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("commit rejected") != std::string::npos);
        REQUIRE(store->documentCount() == 0);
        REQUIRE(store->changeCount() == 0);
        REQUIRE(embeddings->calls == 0);
    }

    SECTION("A store is required") {
        REQUIRE_THROWS_AS(DocumentVersioner(nullptr, embeddings), std::invalid_argument);
    }
}
