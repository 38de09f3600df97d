#pragma once

#include <string>

namespace sitewatch::common {

// Random (v4) UUID in lower-case canonical form.
std::string generateId();

} // namespace sitewatch::common
