#pragma once

#include <string>
#include "core/errors/security_error.hpp"
#include "policy/policy_tables.hpp"

namespace warden::policy {

// Pre-execution gate for shell commands and paths issued inside one
// workspace. All checks are pure string matching against the policy tables:
// nothing is parsed as shell, and no path is resolved against the
// filesystem (symlinks are not followed).
class CommandValidator {
public:
    // `workspace_root` must already be absolute and resolved; it is used
    // verbatim as the containment prefix.
    explicit CommandValidator(std::string workspace_root,
                              PolicyTablesPtr tables = default_policy_tables());

    // Runs the denylist, traversal, network and file-operation scans in that
    // order. The first match is reported.
    core::errors::ValidationResult validate_command(
        const std::string& command) const;

    core::errors::ValidationResult validate_path(const std::string& path) const;

    // Validates the command, then the directory it would run in. An empty
    // `working_dir` stands for the workspace root.
    core::errors::ValidationResult validate_execution(
        const std::string& command, const std::string& working_dir) const;

    // Best-effort cleanup. The result still has to pass validate_command.
    std::string sanitize_command(const std::string& command) const;

    // Rewrites `path` to an absolute form relative to the workspace root.
    // A `../` run that climbs above the filesystem root yields "/".
    std::string normalize_path(const std::string& path) const;

    // Lexically resolves `path` against the workspace root: an absolute
    // `path` replaces the root, and `.` and `..` segments are collapsed.
    // The filesystem is never consulted.
    std::string resolve_path(const std::string& path) const;

private:
    std::string workspace_root_;
    PolicyTablesPtr tables_;
};

}  // namespace warden::policy
