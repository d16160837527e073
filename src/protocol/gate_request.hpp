#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace warden::protocol {

    // Which gate a request goes through
    enum class CheckKind {
        Command,          // validate_command (+ sanitized preview)
        Execution,        // validate_command, then the working directory
        Path,             // validate_path
        File,             // validate_path, then the final path component
        Filename,         // validate_filename
        SanitizeFilename  // sanitize_filename, then validate the result
    };

    // The validated input of one gate invocation
    struct GateRequest {
        CheckKind kind = CheckKind::Command;
        std::string subject;
        std::string working_dir;  // Execution only; empty means the workspace root
        std::string workspace_root = "/tmp/warden-workspace";
        std::optional<std::filesystem::path> policy_file;
        bool verbose = false;
    };

    inline std::string to_string(const CheckKind kind) {
        switch (kind) {
            case CheckKind::Command:
                return "command";
            case CheckKind::Execution:
                return "execution";
            case CheckKind::Path:
                return "path";
            case CheckKind::File:
                return "file";
            case CheckKind::Filename:
                return "filename";
            case CheckKind::SanitizeFilename:
                return "sanitize-filename";
            default:
                return "unknown";
        }
    }

    inline std::optional<CheckKind> check_kind_from_string(const std::string& value) {
        for (const auto kind : {CheckKind::Command, CheckKind::Execution, CheckKind::Path,
                                CheckKind::File, CheckKind::Filename,
                                CheckKind::SanitizeFilename}) {
            if (to_string(kind) == value) {
                return kind;
            }
        }
        return std::nullopt;
    }

} // namespace warden::protocol
