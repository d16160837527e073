#include "cli_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace warden::app::cli {

    using namespace warden::core::errors;
    using warden::protocol::CheckKind;
    using warden::protocol::GateRequest;

    namespace {

        constexpr const char* kUsage =
            "Usage: warden_cli <command|execution|path|file|filename|sanitize-filename> "
            "[--command TEXT] [--path TEXT] [--name TEXT] [--working-dir DIR] "
            "[--workspace DIR] [--policy-file FILE] [--verbose]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> command;
            std::optional<std::string> path;
            std::optional<std::string> name;
            std::optional<std::string> working_dir;
            std::optional<std::string> workspace;
            std::optional<std::string> policy_file;
            bool verbose = false;
        };

        GateError missing_value(const std::string& flag) {
            return GateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        GateError missing_subject(const std::string& check, const std::string& flag) {
            return GateError{ErrorCategory::Input, "Check '" + check + "' requires " + flag,
                             "missing_required_flag"};
        }

        GateError not_applicable(const std::string& check, const std::string& flag) {
            return GateError{ErrorCategory::Input, flag + " is not used by check '" + check + "'",
                             "flag_not_applicable"};
        }

        Result<std::string> resolve_workspace(const std::string& raw) {
            const std::filesystem::path candidate(raw);
            if (!candidate.is_absolute()) {
                return GateError{ErrorCategory::Input, "Workspace root must be an absolute path: " + raw,
                                 "invalid_workspace", "Pass --workspace /abs/dir or set " +
                                 std::string(kWorkspaceEnvVar) + "."};
            }

            std::error_code ec;
            const std::filesystem::path resolved = std::filesystem::weakly_canonical(candidate, ec);
            if (ec) {
                return GateError{ErrorCategory::Input, "Failed to resolve workspace root: " + raw,
                                 "invalid_workspace"};
            }

            std::string root = resolved.string();
            while (root.size() > 1 && root.back() == '/') {
                root.pop_back();
            }
            return root;
        }

    } // namespace

    Result<GateRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No check provided.", "missing_command", kUsage};
        }

        const std::string check = argv[1];
        const auto kind = warden::protocol::check_kind_from_string(check);
        if (!kind.has_value()) {
            return GateError{ErrorCategory::Input, "Unknown check: " + check, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the check
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--command") {
                target = &raw.command;
            } else if (args[i] == "--path") {
                target = &raw.path;
            } else if (args[i] == "--name") {
                target = &raw.name;
            } else if (args[i] == "--working-dir") {
                target = &raw.working_dir;
            } else if (args[i] == "--workspace") {
                target = &raw.workspace;
            } else if (args[i] == "--policy-file") {
                target = &raw.policy_file;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return GateError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return missing_value(args[i]);
            }
            *target = args[++i];
        }

        // 3. Validator Phase: each check takes exactly one subject flag
        GateRequest req;
        req.kind = kind.value();
        req.verbose = raw.verbose;

        switch (req.kind) {
            case CheckKind::Command:
            case CheckKind::Execution:
                if (!raw.command) return missing_subject(check, "--command");
                if (raw.command->empty()) {
                    return GateError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
                }
                if (raw.path) return not_applicable(check, "--path");
                if (raw.name) return not_applicable(check, "--name");
                req.subject = raw.command.value();
                break;
            case CheckKind::Path:
            case CheckKind::File:
                if (!raw.path) return missing_subject(check, "--path");
                if (raw.command) return not_applicable(check, "--command");
                if (raw.name) return not_applicable(check, "--name");
                req.subject = raw.path.value();
                break;
            case CheckKind::Filename:
            case CheckKind::SanitizeFilename:
                if (!raw.name) return missing_subject(check, "--name");
                if (raw.command) return not_applicable(check, "--command");
                if (raw.path) return not_applicable(check, "--path");
                req.subject = raw.name.value();
                break;
        }

        if (raw.working_dir) {
            if (req.kind != CheckKind::Execution) return not_applicable(check, "--working-dir");
            req.working_dir = raw.working_dir.value();
        }

        // Workspace: flag, then environment, then the built-in default
        std::string workspace = kDefaultWorkspace;
        if (raw.workspace) {
            workspace = raw.workspace.value();
        } else if (const char* from_env = std::getenv(kWorkspaceEnvVar)) {
            if (*from_env != '\0') workspace = from_env;
        }

        auto resolved = resolve_workspace(workspace);
        if (is_error(resolved)) {
            return get_error(resolved);
        }
        req.workspace_root = get_value(resolved);

        if (raw.policy_file) {
            if (raw.policy_file->empty()) return missing_value("--policy-file");
            req.policy_file = std::filesystem::path(raw.policy_file.value());
        }

        return req;
    }

} // namespace warden::app::cli
