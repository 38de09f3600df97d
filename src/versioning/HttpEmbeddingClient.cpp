#include "../../include/sitewatch/versioning/HttpEmbeddingClient.h"
#include "../../include/sitewatch/common/Logger.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sitewatch::versioning {

namespace {

std::string truncateUtf8(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    size_t cut = maxBytes;
    // Step back over continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::vector<float> toVector(const json& values) {
    std::vector<float> vector;
    vector.reserve(values.size());
    for (const auto& value : values) {
        vector.push_back(value.get<float>());
    }
    return vector;
}

} // namespace

HttpEmbeddingClient::HttpEmbeddingClient(std::string endpoint,
                                         std::optional<std::string> apiKey,
                                         std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), apiKey_(std::move(apiKey)), timeout_(timeout) {}

size_t HttpEmbeddingClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* response = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

Result<std::vector<float>> HttpEmbeddingClient::embed(const std::string& text) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("Failed to create CURL handle for embedding request");
        return Result<std::vector<float>>::Failure("Failed to create CURL handle");
    }

    const std::string body = json{{"input", truncateUtf8(text, kMaxInputBytes)}}.dump();
    LOG_DEBUG("Embedding request to " + endpoint_ + ", payload size: " + std::to_string(body.size()) + " bytes");

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (apiKey_) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + *apiKey_).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    std::string response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string error = "CURL error: " + std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
        LOG_WARNING("Embedding request failed: " + error);
        return Result<std::vector<float>>::Failure(error);
    }
    if (httpCode != 200) {
        LOG_WARNING("Embedding service returned HTTP " + std::to_string(httpCode));
        return Result<std::vector<float>>::Failure("Embedding service returned HTTP " + std::to_string(httpCode));
    }

    try {
        json parsed = json::parse(response);
        if (parsed.contains("embedding") && parsed["embedding"].is_array()) {
            return Result<std::vector<float>>::Success(toVector(parsed["embedding"]), "Embedding created");
        }
        if (parsed.contains("data") && parsed["data"].is_array() && !parsed["data"].empty() &&
            parsed["data"][0].contains("embedding")) {
            return Result<std::vector<float>>::Success(toVector(parsed["data"][0]["embedding"]), "Embedding created");
        }
        return Result<std::vector<float>>::Failure("Embedding response has no embedding array");
    } catch (const json::exception& e) {
        LOG_WARNING("Unreadable embedding response: " + std::string(e.what()));
        return Result<std::vector<float>>::Failure("Unreadable embedding response: " + std::string(e.what()));
    }
}

} // namespace sitewatch::versioning
