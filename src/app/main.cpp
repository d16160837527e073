#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/check_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_loader.hpp"
#include "policy/policy_tables.hpp"
#include "protocol/validation_report.hpp"
#include "runtime/gate_runner.hpp"

namespace {

// Exit codes seen by the executing collaborator
constexpr int kExitAllowed = 0;
constexpr int kExitRejected = 1;
constexpr int kExitInputError = 2;
constexpr int kExitPolicyError = 3;

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this invocation
    warden::core::logging::Logger::get().set_context_id(
        warden::core::config::generate_check_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        const auto& err = warden::core::errors::get_error(parsed);
        WARDEN_LOG_ERROR(warden::core::errors::to_string(err.category) + " error [" +
                         err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            WARDEN_LOG_INFO("Hint: " + err.hint);
        }
        return kExitInputError;
    }

    const auto& req = warden::core::errors::get_value(parsed);
    if (req.verbose) {
        warden::core::logging::Logger::get().set_min_level(
            warden::core::logging::LogLevel::DEBUG);
    }
    WARDEN_LOG_DEBUG("Workspace root: " + req.workspace_root);

    // 3. Policy tables: built-in, or overridden by a policy file
    warden::policy::PolicyTablesPtr tables = warden::policy::default_policy_tables();
    if (req.policy_file.has_value()) {
        auto loaded = warden::policy::load_policy_tables(req.policy_file.value());
        if (warden::core::errors::is_error(loaded)) {
            const auto& err = warden::core::errors::get_error(loaded);
            WARDEN_LOG_ERROR(warden::core::errors::to_string(err.category) + " error [" +
                             err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                WARDEN_LOG_INFO("Hint: " + err.hint);
            }
            return kExitPolicyError;
        }
        tables = warden::core::errors::get_value(loaded);
        WARDEN_LOG_DEBUG("Loaded policy file: " + req.policy_file->string());
    }

    // 4. Run the gate and print the verdict
    const warden::runtime::GateRunner runner(req.workspace_root, tables);
    const auto report = runner.run(req);

    std::cout << warden::protocol::report_to_json(report).dump(
                     2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;

    if (!report.valid) {
        const auto& error = report.error.value();
        WARDEN_LOG_WARN("Rejected " + warden::protocol::to_string(report.check) +
                        " [" + warden::core::errors::to_string(error.code) +
                        "]: " + error.reason);
        return kExitRejected;
    }

    WARDEN_LOG_DEBUG("Allowed " + warden::protocol::to_string(report.check));
    return kExitAllowed;
}
