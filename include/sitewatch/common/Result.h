#pragma once
#include <string>
#include <utility>

namespace sitewatch {

// Outcome of a record-store or service call. Failures carry a message and a
// default-constructed value; callers check `success` before using `value`.
template <typename T>
struct Result {
    bool success = false;
    T value{};
    std::string message;

    static Result<T> Success(T value, const std::string& message) {
        return { true, std::move(value), message };
    }

    static Result<T> Failure(const std::string& message) {
        return { false, T{}, message };
    }

    Result(bool success, T value, const std::string& message)
        : success(success), value(std::move(value)), message(message)
    {
    }

    Result() = default;
};

} // namespace sitewatch
