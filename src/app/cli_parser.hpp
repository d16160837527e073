#pragma once
#include "core/errors/gate_errors.hpp"
#include "protocol/gate_request.hpp"

namespace warden::app::cli {
    inline constexpr const char* kWorkspaceEnvVar = "WARDEN_WORKSPACE_DIR";
    inline constexpr const char* kDefaultWorkspace = "/tmp/warden-workspace";

    warden::core::errors::Result<warden::protocol::GateRequest> parse_and_validate(int argc, char* argv[]);
}
