#pragma once

#include <cstddef>
#include <string>
#include "core/errors/security_error.hpp"
#include "policy/policy_tables.hpp"

namespace warden::policy {

// Filename checks that do not depend on any workspace.
class PathValidator {
public:
    static constexpr std::size_t kMaxFilenameLength = 255;

    explicit PathValidator(PolicyTablesPtr tables = default_policy_tables());

    // Null bytes, then denied extensions, then reserved device names.
    core::errors::ValidationResult validate_filename(const std::string& name) const;

    // Strips control characters, replaces characters that are illegal on
    // common filesystems with '_', trims dots and whitespace and caps the
    // length at kMaxFilenameLength bytes, keeping the extension. Reserved
    // device names are left alone; validate_filename rejects them.
    std::string sanitize_filename(const std::string& name) const;

private:
    PolicyTablesPtr tables_;
};

}  // namespace warden::policy
