#include "policy/command_validator.hpp"

#include <cctype>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>
#include "policy/text_match.hpp"

namespace warden::policy {

using core::errors::ErrorCode;
using core::errors::SecurityError;
using core::errors::ValidationResult;

namespace {

constexpr const char* kCommandOperation = "command_validation";
constexpr const char* kPathOperation = "path_validation";

bool is_quote(const char c) { return c == '"' || c == '\''; }

bool is_shell_metacharacter(const char c) {
    switch (c) {
        case ';':
        case '&':
        case '|':
        case '`':
        case '$':
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        if (end > start) {
            parts.push_back(path.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return parts;
}

std::string collapse_slashes(const std::string& path) {
    std::string collapsed;
    collapsed.reserve(path.size());
    for (const char c : path) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/') {
            continue;
        }
        collapsed.push_back(c);
    }
    return collapsed;
}

ValidationResult command_violation(const ErrorCode code, std::string message,
                                   std::string reason) {
    return ValidationResult::fail(SecurityError{code, std::move(message),
                                                kCommandOperation,
                                                std::move(reason), std::nullopt});
}

}  // namespace

CommandValidator::CommandValidator(std::string workspace_root,
                                   PolicyTablesPtr tables)
    : workspace_root_(std::move(workspace_root)),
      tables_(tables ? std::move(tables) : default_policy_tables()) {}

ValidationResult CommandValidator::validate_command(
    const std::string& command) const {
    const std::string normalized = text::lowercase(text::trim(command));

    if (const auto hit =
            text::first_substring_match(normalized, tables_->dangerous_commands)) {
        return command_violation(ErrorCode::DangerousCommand,
                                 "Command contains dangerous operation: " + *hit,
                                 "Command blocked for security reasons");
    }

    if (text::first_substring_match(normalized, tables_->traversal_patterns)) {
        return command_violation(
            ErrorCode::PathTraversal,
            "Command attempts to access paths outside workspace",
            "Path traversal detected");
    }

    if (text::first_substring_match(normalized, tables_->network_patterns)) {
        return command_violation(ErrorCode::NetworkOperation,
                                 "Command attempts network operation",
                                 "Network operations require explicit approval");
    }

    if (text::first_substring_match(normalized,
                                    tables_->dangerous_file_operations)) {
        return command_violation(
            ErrorCode::DangerousFileOp,
            "Command contains potentially dangerous file operation",
            "File operation blocked for security reasons");
    }

    return ValidationResult::ok();
}

ValidationResult CommandValidator::validate_path(const std::string& path) const {
    const std::string normalized = normalize_path(path);

    if (!text::starts_with(normalized, workspace_root_)) {
        return ValidationResult::fail(
            SecurityError{ErrorCode::PathOutOfBounds,
                          "Path is outside workspace: " + path, kPathOperation,
                          "Path must be within workspace directory", path});
    }

    // A workspace nested under a protected prefix is never blocked.
    for (const auto& protected_path : tables_->protected_paths) {
        if (text::starts_with(normalized, protected_path) &&
            !text::starts_with(normalized, workspace_root_)) {
            return ValidationResult::fail(SecurityError{
                ErrorCode::ProtectedPath,
                "Path accesses protected system directory: " + path,
                kPathOperation, "System paths are protected", path});
        }
    }

    return ValidationResult::ok();
}

ValidationResult CommandValidator::validate_execution(
    const std::string& command, const std::string& working_dir) const {
    auto command_result = validate_command(command);
    if (!command_result.valid()) {
        return command_result;
    }

    if (working_dir.empty()) {
        return validate_path(workspace_root_);
    }
    return validate_path(resolve_path(workspace_root_ + "/" + working_dir));
}

std::string CommandValidator::sanitize_command(const std::string& command) const {
    std::string collapsed;
    collapsed.reserve(command.size());
    bool in_whitespace = false;
    for (const char c : command) {
        if (is_shell_metacharacter(c)) {
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_whitespace = true;
            continue;
        }
        if (in_whitespace && !collapsed.empty()) {
            collapsed.push_back(' ');
        }
        in_whitespace = false;
        collapsed.push_back(c);
    }

    // Peel the enclosing quotes together with any space they exposed.
    std::size_t begin = 0;
    std::size_t end = collapsed.size();
    while (begin < end && (is_quote(collapsed[begin]) || collapsed[begin] == ' ')) {
        ++begin;
    }
    while (end > begin && (is_quote(collapsed[end - 1]) || collapsed[end - 1] == ' ')) {
        --end;
    }
    return collapsed.substr(begin, end - begin);
}

std::string CommandValidator::normalize_path(const std::string& path) const {
    std::string candidate = text::trim(path);

    if (text::starts_with(candidate, "./")) {
        candidate = workspace_root_ + "/" + candidate.substr(2);
    } else if (text::starts_with(candidate, "../")) {
        std::size_t levels = 0;
        std::size_t offset = 0;
        while (candidate.compare(offset, 3, "../") == 0) {
            ++levels;
            offset += 3;
        }
        const std::string remaining = candidate.substr(offset);

        const auto workspace_parts = split_components(workspace_root_);
        if (levels >= workspace_parts.size()) {
            return "/";
        }

        std::string base;
        for (std::size_t i = 0; i < workspace_parts.size() - levels; ++i) {
            base += "/" + workspace_parts[i];
        }
        candidate = base + "/" + remaining;
    } else if (!text::starts_with(candidate, "/")) {
        candidate = workspace_root_ + "/" + candidate;
    }

    candidate = collapse_slashes(candidate);
    if (candidate.size() > 1 && candidate.back() == '/') {
        candidate.pop_back();
    }
    return candidate;
}

std::string CommandValidator::resolve_path(const std::string& path) const {
    const std::filesystem::path requested(path);
    const std::filesystem::path combined =
        requested.is_absolute() ? requested
                                : std::filesystem::path(workspace_root_) / requested;

    std::string resolved = combined.lexically_normal().generic_string();
    if (resolved.size() > 1 && resolved.back() == '/') {
        resolved.pop_back();
    }
    return resolved;
}

}  // namespace warden::policy
