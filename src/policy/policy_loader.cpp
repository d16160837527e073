#include "policy/policy_loader.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

using Table = std::vector<std::string> PolicyTables::*;

struct TableBinding {
    const char* key;
    Table table;
};

const TableBinding kTableBindings[] = {
    {"dangerous_commands", &PolicyTables::dangerous_commands},
    {"traversal_patterns", &PolicyTables::traversal_patterns},
    {"network_patterns", &PolicyTables::network_patterns},
    {"dangerous_file_operations", &PolicyTables::dangerous_file_operations},
    {"protected_paths", &PolicyTables::protected_paths},
    {"dangerous_extensions", &PolicyTables::dangerous_extensions},
    {"reserved_filenames", &PolicyTables::reserved_filenames}};

const TableBinding* find_binding(const std::string& key) {
    for (const auto& binding : kTableBindings) {
        if (key == binding.key) {
            return &binding;
        }
    }
    return nullptr;
}

core::errors::Result<std::vector<std::string>> read_table(const std::string& key,
                                                          const json& value) {
    if (!value.is_array()) {
        return GateError{ErrorCategory::Config,
                         "Policy table '" + key + "' must be an array of strings.",
                         "invalid_policy_table"};
    }

    std::vector<std::string> entries;
    entries.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            return GateError{ErrorCategory::Config,
                             "Policy table '" + key + "' contains a non-string entry.",
                             "invalid_policy_table"};
        }
        auto entry = item.get<std::string>();
        if (entry.empty()) {
            return GateError{ErrorCategory::Config,
                             "Policy table '" + key + "' contains an empty entry.",
                             "invalid_policy_table",
                             "An empty pattern would match every input."};
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace

core::errors::Result<PolicyTablesPtr> parse_policy_tables(
    const std::string& json_text) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return GateError{ErrorCategory::Config, "Policy file is not valid JSON.",
                         "policy_parse_failed"};
    }
    if (!document.is_object()) {
        return GateError{ErrorCategory::Config,
                         "Policy file must contain a JSON object.",
                         "policy_not_object"};
    }

    PolicyTables tables;
    for (const auto& item : document.items()) {
        const TableBinding* binding = find_binding(item.key());
        if (binding == nullptr) {
            return GateError{ErrorCategory::Config,
                             "Unknown policy key: " + item.key(),
                             "unknown_policy_key",
                             "Valid keys: dangerous_commands, traversal_patterns, "
                             "network_patterns, dangerous_file_operations, "
                             "protected_paths, dangerous_extensions, "
                             "reserved_filenames."};
        }

        auto entries = read_table(item.key(), item.value());
        if (core::errors::is_error(entries)) {
            return core::errors::get_error(entries);
        }
        tables.*(binding->table) = core::errors::get_value(entries);
    }

    return PolicyTablesPtr(std::make_shared<const PolicyTables>(std::move(tables)));
}

core::errors::Result<PolicyTablesPtr> load_policy_tables(
    const std::filesystem::path& policy_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(policy_file, ec) || ec) {
        return GateError{ErrorCategory::Config,
                         "Policy file does not exist: " + policy_file.string(),
                         "policy_file_missing"};
    }

    std::ifstream in(policy_file);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Config,
                         "Unable to open policy file: " + policy_file.string(),
                         "policy_file_unreadable"};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return GateError{ErrorCategory::Config,
                         "Unable to read policy file: " + policy_file.string(),
                         "policy_file_unreadable"};
    }

    return parse_policy_tables(buffer.str());
}

}  // namespace warden::policy
