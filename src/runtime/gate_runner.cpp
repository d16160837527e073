#include "runtime/gate_runner.hpp"

#include <utility>

namespace warden::runtime {

using protocol::CheckKind;
using protocol::GateRequest;
using protocol::ValidationReport;

namespace {

std::string last_component(const std::string& resolved_path) {
    const auto slash = resolved_path.rfind('/');
    if (slash == std::string::npos) {
        return resolved_path;
    }
    return resolved_path.substr(slash + 1);
}

}  // namespace

GateRunner::GateRunner(std::string workspace_root, policy::PolicyTablesPtr tables)
    : command_validator_(std::move(workspace_root), tables),
      path_validator_(tables) {}

ValidationReport GateRunner::run(const GateRequest& request) const {
    switch (request.kind) {
        case CheckKind::Command: {
            auto report = protocol::make_report(
                request.kind, request.subject,
                command_validator_.validate_command(request.subject));
            report.sanitized = command_validator_.sanitize_command(request.subject);
            return report;
        }
        case CheckKind::Execution: {
            auto report = protocol::make_report(
                request.kind, request.subject,
                command_validator_.validate_execution(request.subject,
                                                      request.working_dir));
            report.sanitized = command_validator_.sanitize_command(request.subject);
            return report;
        }
        case CheckKind::Path: {
            auto report = protocol::make_report(
                request.kind, request.subject,
                command_validator_.validate_path(request.subject));
            report.normalized = command_validator_.normalize_path(request.subject);
            return report;
        }
        case CheckKind::File:
            return check_file(request.subject);
        case CheckKind::Filename:
            return protocol::make_report(
                request.kind, request.subject,
                path_validator_.validate_filename(request.subject));
        case CheckKind::SanitizeFilename:
            break;
    }

    const std::string sanitized = path_validator_.sanitize_filename(request.subject);
    auto report = protocol::make_report(request.kind, request.subject,
                                        path_validator_.validate_filename(sanitized));
    report.sanitized = sanitized;
    return report;
}

// The path is resolved before either check so a `..` in the middle cannot
// carry a write outside the workspace.
ValidationReport GateRunner::check_file(const std::string& path) const {
    const std::string resolved = command_validator_.resolve_path(path);

    auto path_result = command_validator_.validate_path(resolved);
    if (!path_result.valid()) {
        auto report = protocol::make_report(CheckKind::File, path, path_result);
        report.normalized = resolved;
        return report;
    }

    auto report = protocol::make_report(
        CheckKind::File, path,
        path_validator_.validate_filename(last_component(resolved)));
    report.normalized = resolved;
    return report;
}

}  // namespace warden::runtime
