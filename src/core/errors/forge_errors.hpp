#pragma once
#include <string>
#include <utility>
#include <variant>

namespace forge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., invalid CLI flag or timeout specification
        Filesystem,    // Workspace directory could not be created or written
        Build,         // Container image build failed
        RuntimeStart,  // Engine unreachable or invalid launch configuration
        Stream,        // Log transport interrupted unexpectedly
        Timeout,       // Deadline elapsed before a terminal marker
        Cancelled,     // External interrupt
        Execution,     // Fatal marker with detail in the container output
        Unclassified,  // Fatal marker or exit without structured detail
        Internal       // Logic bug or impossible state
    };

    // The standardized error payload
    struct ForgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Recovery tip for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a ForgeError.
    template <typename T>
    using Result = std::variant<T, ForgeError>;

    // For operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ForgeError>(result);
    }

    template <typename T>
    const ForgeError& get_error(const Result<T>& result) {
        return std::get<ForgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "InputError";
            case ErrorCategory::Filesystem:   return "FilesystemError";
            case ErrorCategory::Build:        return "BuildError";
            case ErrorCategory::RuntimeStart: return "RuntimeStartError";
            case ErrorCategory::Stream:       return "StreamError";
            case ErrorCategory::Timeout:      return "TimeoutExceeded";
            case ErrorCategory::Cancelled:    return "Cancelled";
            case ErrorCategory::Execution:    return "ExecutionError";
            case ErrorCategory::Unclassified: return "UnclassifiedFailure";
            case ErrorCategory::Internal:     return "InternalError";
            default: return "UnknownError";
        }
    }

} // namespace forge::core::errors
