#include "../../include/sitewatch/storage/MongoInstance.h"

namespace sitewatch::storage {

std::unique_ptr<mongocxx::instance> MongoInstance::instance;
std::mutex MongoInstance::mutex;

mongocxx::instance& MongoInstance::getInstance() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!instance) {
        instance = std::make_unique<mongocxx::instance>();
    }
    return *instance;
}

} // namespace sitewatch::storage
