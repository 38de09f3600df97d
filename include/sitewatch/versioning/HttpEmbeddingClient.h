#pragma once

#include "EmbeddingService.h"

#include <chrono>
#include <optional>
#include <string>

namespace sitewatch::versioning {

// Embedding endpoint spoken over HTTP with libcurl. Sends {"input": text}
// and accepts either {"embedding": [...]} or {"data": [{"embedding": [...]}]}.
class HttpEmbeddingClient : public EmbeddingService {
public:
    HttpEmbeddingClient(std::string endpoint,
                        std::optional<std::string> apiKey,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    Result<std::vector<float>> embed(const std::string& text) override;

    // Longest input sent; longer text is cut at a UTF-8 boundary
    static constexpr size_t kMaxInputBytes = 32000;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string endpoint_;
    std::optional<std::string> apiKey_;
    std::chrono::milliseconds timeout_;
};

} // namespace sitewatch::versioning
