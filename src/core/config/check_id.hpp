#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace warden::core::config {

    inline constexpr const char* kCheckIdPrefix = "chk-";

    // "chk-" followed by one random 32-bit value as 8 zero-padded hex digits.
    // Tags the log lines of one gate invocation so a rejection logged on
    // stderr can be matched to the JSON report on stdout.
    inline std::string generate_check_id() {
        std::random_device rd;
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream ss;
        ss << kCheckIdPrefix << std::hex << std::setw(8) << std::setfill('0') << dis(rd);
        return ss.str();
    }

} // namespace warden::core::config
