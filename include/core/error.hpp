#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace nlquery {

/**
 * @brief Error categories surfaced by the engine
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,
    INTROSPECTION_ERROR,
    QUERY_NOT_UNDERSTOOD,
    TIMEOUT_ERROR,
    SYNTAX_ERROR,
    INDEX_UNAVAILABLE,
    CACHE_CORRUPTION,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "None";
        case ErrorCategory::CONNECTION_ERROR:     return "ConnectionError";
        case ErrorCategory::INTROSPECTION_ERROR:  return "IntrospectionError";
        case ErrorCategory::QUERY_NOT_UNDERSTOOD: return "QueryNotUnderstood";
        case ErrorCategory::TIMEOUT_ERROR:        return "TimeoutError";
        case ErrorCategory::SYNTAX_ERROR:         return "SyntaxError";
        case ErrorCategory::INDEX_UNAVAILABLE:    return "IndexUnavailable";
        case ErrorCategory::CACHE_CORRUPTION:     return "CacheCorruption";
        case ErrorCategory::INTERNAL_ERROR:       return "InternalError";
    }
    return "InternalError";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace nlquery
