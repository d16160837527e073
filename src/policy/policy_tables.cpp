#include "policy/policy_tables.hpp"

namespace warden::policy {

PolicyTablesPtr default_policy_tables() {
    static const PolicyTablesPtr tables = std::make_shared<const PolicyTables>();
    return tables;
}

}  // namespace warden::policy
