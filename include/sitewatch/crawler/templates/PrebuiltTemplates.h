#pragma once
#include "TemplateTypes.h"
#include <vector>

namespace sitewatch {
namespace crawler {
namespace templates {

// Built-in profiles, in suggestion-priority order.
const std::vector<WebsiteTemplate>& prebuiltTemplates();

} // namespace templates
} // namespace crawler
} // namespace sitewatch
