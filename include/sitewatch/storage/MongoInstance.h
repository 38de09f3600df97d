#pragma once

#include <memory>
#include <mutex>
#include <mongocxx/instance.hpp>

namespace sitewatch::storage {

// The driver allows exactly one mongocxx::instance per process.
class MongoInstance {
public:
    static mongocxx::instance& getInstance();

private:
    static std::unique_ptr<mongocxx::instance> instance;
    static std::mutex mutex;
};

} // namespace sitewatch::storage
