#include "../../include/sitewatch/common/IdGenerator.h"

#include <uuid/uuid.h>

namespace sitewatch::common {

std::string generateId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

} // namespace sitewatch::common
