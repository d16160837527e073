#pragma once

#include <string>
#include "policy/command_validator.hpp"
#include "policy/path_validator.hpp"
#include "policy/policy_tables.hpp"
#include "protocol/gate_request.hpp"
#include "protocol/validation_report.hpp"

namespace warden::runtime {

// Routes a GateRequest to the validators that cover its check kind and
// collects their verdict into one report.
class GateRunner {
public:
    explicit GateRunner(std::string workspace_root,
                        policy::PolicyTablesPtr tables = policy::default_policy_tables());

    protocol::ValidationReport run(const protocol::GateRequest& request) const;

private:
    protocol::ValidationReport check_file(const std::string& path) const;

    policy::CommandValidator command_validator_;
    policy::PathValidator path_validator_;
};

}  // namespace warden::runtime
