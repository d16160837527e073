#pragma once
#include <optional>
#include <string>
#include <utility>

namespace warden::core::errors {

    // Machine-readable policy violation codes. The wire form of each code is
    // its own name, see to_string() below.
    enum class ErrorCode {
        DangerousCommand,
        PathTraversal,
        NetworkOperation,
        DangerousFileOp,
        PathOutOfBounds,
        ProtectedPath,
        InvalidFilename,
        DangerousExtension,
        ReservedFilename
    };

    inline std::string to_string(const ErrorCode code) {
        switch (code) {
            case ErrorCode::DangerousCommand:
                return "DANGEROUS_COMMAND";
            case ErrorCode::PathTraversal:
                return "PATH_TRAVERSAL";
            case ErrorCode::NetworkOperation:
                return "NETWORK_OPERATION";
            case ErrorCode::DangerousFileOp:
                return "DANGEROUS_FILE_OP";
            case ErrorCode::PathOutOfBounds:
                return "PATH_OUT_OF_BOUNDS";
            case ErrorCode::ProtectedPath:
                return "PROTECTED_PATH";
            case ErrorCode::InvalidFilename:
                return "INVALID_FILENAME";
            case ErrorCode::DangerousExtension:
                return "DANGEROUS_EXTENSION";
            case ErrorCode::ReservedFilename:
                return "RESERVED_FILENAME";
            default:
                return "UNKNOWN";
        }
    }

    // One policy violation. Built fresh for every rejected request; message
    // and reason are safe to show to an operator verbatim.
    struct SecurityError {
        ErrorCode code;
        std::string message;
        std::string operation;
        std::string reason;
        std::optional<std::string> path;
    };

    // Verdict of a single check. The error is present iff valid is false, so
    // the only ways to build one are ok() and fail().
    class ValidationResult {
    public:
        static ValidationResult ok() { return ValidationResult(); }

        static ValidationResult fail(SecurityError error) {
            return ValidationResult(std::move(error));
        }

        bool valid() const { return !error_.has_value(); }
        const std::optional<SecurityError>& error() const { return error_; }

        explicit operator bool() const { return valid(); }

    private:
        ValidationResult() = default;
        explicit ValidationResult(SecurityError error) : error_(std::move(error)) {}

        std::optional<SecurityError> error_;
    };

} // namespace warden::core::errors
