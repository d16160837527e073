#include "policy/path_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include "policy/text_match.hpp"

namespace warden::policy {

using core::errors::ErrorCode;
using core::errors::SecurityError;
using core::errors::ValidationResult;

namespace {

constexpr const char* kFilenameOperation = "filename_validation";
constexpr const char* kUnnamedFile = "unnamed_file";

bool is_illegal_filename_char(const char c) {
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

bool is_trimmed_edge(const char c) {
    return c == '.' || std::isspace(static_cast<unsigned char>(c));
}

// Drops C0 controls and the UTF-8 encoding of C1 controls (U+0080..U+009F).
std::string strip_control_characters(const std::string& name) {
    std::string stripped;
    stripped.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto byte = static_cast<unsigned char>(name[i]);
        if (byte < 0x20) {
            continue;
        }
        if (byte == 0xC2 && i + 1 < name.size()) {
            const auto next = static_cast<unsigned char>(name[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                ++i;
                continue;
            }
        }
        stripped.push_back(name[i]);
    }
    return stripped;
}

// Longest prefix of at most `max_bytes` that does not split a UTF-8 sequence.
std::string utf8_prefix(const std::string& value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

bool contains_ignoring_case(const std::vector<std::string>& table,
                            const std::string& lowered) {
    return std::any_of(table.begin(), table.end(), [&](const std::string& entry) {
        return text::lowercase(entry) == lowered;
    });
}

ValidationResult filename_violation(const ErrorCode code, std::string message,
                                    std::string reason) {
    return ValidationResult::fail(SecurityError{code, std::move(message),
                                                kFilenameOperation,
                                                std::move(reason), std::nullopt});
}

}  // namespace

PathValidator::PathValidator(PolicyTablesPtr tables)
    : tables_(tables ? std::move(tables) : default_policy_tables()) {}

ValidationResult PathValidator::validate_filename(const std::string& name) const {
    if (name.find('\0') != std::string::npos) {
        return filename_violation(ErrorCode::InvalidFilename,
                                  "Filename contains null bytes",
                                  "Null bytes are not allowed in filenames");
    }

    const std::string lowered = text::lowercase(name);
    const auto last_dot = lowered.rfind('.');
    if (last_dot != std::string::npos) {
        const std::string extension = lowered.substr(last_dot + 1);
        if (!extension.empty() &&
            contains_ignoring_case(tables_->dangerous_extensions, "." + extension)) {
            return filename_violation(
                ErrorCode::DangerousExtension,
                "File extension ." + extension + " is not allowed",
                "File extension blocked for security reasons");
        }
    }

    const std::string base = text::lowercase(name.substr(0, name.find('.')));
    if (contains_ignoring_case(tables_->reserved_filenames, base)) {
        return filename_violation(ErrorCode::ReservedFilename,
                                  "Filename " + name + " is reserved",
                                  "Reserved filenames are not allowed");
    }

    return ValidationResult::ok();
}

std::string PathValidator::sanitize_filename(const std::string& name) const {
    std::string sanitized = strip_control_characters(name);
    std::replace_if(sanitized.begin(), sanitized.end(), is_illegal_filename_char, '_');

    std::size_t begin = 0;
    std::size_t end = sanitized.size();
    while (begin < end && is_trimmed_edge(sanitized[begin])) {
        ++begin;
    }
    while (end > begin && is_trimmed_edge(sanitized[end - 1])) {
        --end;
    }
    sanitized = sanitized.substr(begin, end - begin);

    if (sanitized.empty()) {
        return kUnnamedFile;
    }
    if (sanitized.size() <= kMaxFilenameLength) {
        return sanitized;
    }

    const auto last_dot = sanitized.rfind('.');
    if (last_dot == std::string::npos) {
        return utf8_prefix(sanitized, kMaxFilenameLength);
    }
    const std::string extension = sanitized.substr(last_dot + 1);
    if (extension.size() + 1 >= kMaxFilenameLength) {
        return utf8_prefix(sanitized, kMaxFilenameLength);
    }

    const std::size_t base_budget = kMaxFilenameLength - (extension.size() + 1);
    return utf8_prefix(sanitized, base_budget) + "." + extension;
}

}  // namespace warden::policy
