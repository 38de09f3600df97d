#include "../../include/sitewatch/storage/Records.h"

#include <stdexcept>

namespace sitewatch::storage {

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::IDLE: return "idle";
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
    }
    return "idle";
}

JobStatus jobStatusFromString(const std::string& status) {
    if (status == "running") return JobStatus::RUNNING;
    if (status == "completed") return JobStatus::COMPLETED;
    if (status == "failed") return JobStatus::FAILED;
    return JobStatus::IDLE;
}

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
    }
    return "running";
}

RunStatus runStatusFromString(const std::string& status) {
    if (status == "completed") return RunStatus::COMPLETED;
    if (status == "failed") return RunStatus::FAILED;
    return RunStatus::RUNNING;
}

std::string changeTypeToString(ChangeType type) {
    switch (type) {
        case ChangeType::CREATED: return "created";
        case ChangeType::UPDATED: return "updated";
        case ChangeType::DELETED: return "deleted";
        case ChangeType::TITLE_CHANGED: return "title_changed";
        case ChangeType::CONTENT_CHANGED: return "content_changed";
    }
    return "created";
}

ChangeType changeTypeFromString(const std::string& type) {
    if (type == "created") return ChangeType::CREATED;
    if (type == "updated") return ChangeType::UPDATED;
    if (type == "deleted") return ChangeType::DELETED;
    if (type == "title_changed") return ChangeType::TITLE_CHANGED;
    if (type == "content_changed") return ChangeType::CONTENT_CHANGED;
    throw std::invalid_argument("Unknown change type: " + type);
}

} // namespace sitewatch::storage
