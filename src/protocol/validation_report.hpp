#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/security_error.hpp"
#include "protocol/gate_request.hpp"

namespace warden::protocol {

// What the gate tells its caller about one request.
struct ValidationReport {
    CheckKind check = CheckKind::Command;
    std::string subject;
    bool valid = false;
    std::optional<core::errors::SecurityError> error;
    std::optional<std::string> sanitized;
    std::optional<std::string> normalized;
};

ValidationReport make_report(CheckKind check, std::string subject,
                             const core::errors::ValidationResult& result);

nlohmann::json error_to_json(const core::errors::SecurityError& error);

// {"valid": bool, "error": {...}} with "error" omitted when valid.
nlohmann::json result_to_json(const core::errors::ValidationResult& result);

nlohmann::json report_to_json(const ValidationReport& report);

}  // namespace warden::protocol
