#include "protocol/validation_report.hpp"

#include <utility>

namespace warden::protocol {

using nlohmann::json;

ValidationReport make_report(const CheckKind check, std::string subject,
                             const core::errors::ValidationResult& result) {
    ValidationReport report;
    report.check = check;
    report.subject = std::move(subject);
    report.valid = result.valid();
    report.error = result.error();
    return report;
}

json error_to_json(const core::errors::SecurityError& error) {
    json payload;
    payload["code"] = core::errors::to_string(error.code);
    payload["message"] = error.message;
    payload["operation"] = error.operation;
    payload["reason"] = error.reason;
    if (error.path.has_value()) {
        payload["path"] = error.path.value();
    }
    return payload;
}

json result_to_json(const core::errors::ValidationResult& result) {
    json payload;
    payload["valid"] = result.valid();
    if (result.error().has_value()) {
        payload["error"] = error_to_json(result.error().value());
    }
    return payload;
}

json report_to_json(const ValidationReport& report) {
    json payload;
    payload["check"] = to_string(report.check);
    payload["subject"] = report.subject;
    payload["valid"] = report.valid;
    if (report.error.has_value()) {
        payload["error"] = error_to_json(report.error.value());
    }
    if (report.sanitized.has_value()) {
        payload["sanitized"] = report.sanitized.value();
    }
    if (report.normalized.has_value()) {
        payload["normalized"] = report.normalized.value();
    }
    return payload;
}

}  // namespace warden::protocol
