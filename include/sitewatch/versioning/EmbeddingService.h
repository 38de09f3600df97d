#pragma once

#include "../common/Result.h"

#include <string>
#include <vector>

namespace sitewatch::versioning {

// embed(text) -> vector. Failures are reported, never thrown.
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;
};

} // namespace sitewatch::versioning
