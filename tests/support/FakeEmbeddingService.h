#pragma once

#include "../../include/sitewatch/versioning/EmbeddingService.h"

#include <atomic>

namespace sitewatch::testing {

class FakeEmbeddingService : public versioning::EmbeddingService {
public:
    Result<std::vector<float>> embed(const std::string& text) override {
        ++calls;
        if (fail) {
            return Result<std::vector<float>>::Failure("embedding service unavailable");
        }
        return Result<std::vector<float>>::Success({static_cast<float>(text.size()), 1.0f, 0.5f}, "ok");
    }

    std::atomic<int> calls{0};
    bool fail = false;
};

} // namespace sitewatch::testing
