#pragma once

#include <filesystem>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "policy/policy_tables.hpp"

namespace warden::policy {

// Builds policy tables from a JSON object. Each recognised key replaces the
// matching default table wholesale; absent keys keep their defaults.
core::errors::Result<PolicyTablesPtr> parse_policy_tables(
    const std::string& json_text);

core::errors::Result<PolicyTablesPtr> load_policy_tables(
    const std::filesystem::path& policy_file);

}  // namespace warden::policy
