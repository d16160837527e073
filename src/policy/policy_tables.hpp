#pragma once

#include <memory>
#include <string>
#include <vector>

namespace warden::policy {

// Denylists consulted by the validators. Every entry is matched as a
// substring or prefix; see CommandValidator and PathValidator.
struct PolicyTables {
    std::vector<std::string> dangerous_commands = {
        "rm -rf /",
        "sudo rm",
        "format",
        "fdisk",
        "mkfs",
        "dd",
        "kill -9",
        "killall",
        "shutdown",
        "reboot",
        "halt",
        "init 0",
        "init 6",
        "mount",
        "umount",
        "chown -R",
        "chmod -R 777",
        "chmod -R 755 /",
        "find / -delete",
        "find / -exec rm",
        ":(){ :|:& };:",
        "wget http",
        "curl http",
        "nc -l",
        "netcat -l"};

    std::vector<std::string> traversal_patterns = {
        "../",
        "..\\",
        "..%2f",
        "..%5c",
        "%2e%2e%2f",
        "%2e%2e%5c"};

    std::vector<std::string> network_patterns = {
        "wget",
        "curl",
        "nc -l",
        "netcat -l",
        "python -m http.server",
        "python3 -m http.server",
        "node -e \"require('http')",
        "ssh",
        "scp",
        "rsync",
        "ftp",
        "telnet"};

    std::vector<std::string> dangerous_file_operations = {
        "rm -rf",
        "rm -f /",
        "rm -r /",
        "find / -delete",
        "find / -exec rm",
        "chmod -R 777",
        "chown -R",
        "> /dev/null",
        "2>/dev/null"};

    std::vector<std::string> protected_paths = {
        "/",
        "/bin",
        "/sbin",
        "/usr",
        "/etc",
        "/var",
        "/lib",
        "/boot",
        "/sys",
        "/proc",
        "/dev",
        "/root",
        "/home"};

    std::vector<std::string> dangerous_extensions = {
        ".exe",
        ".bat",
        ".cmd",
        ".com",
        ".scr",
        ".pif",
        ".vbs",
        ".jar"};

    std::vector<std::string> reserved_filenames = {
        "CON",  "PRN",  "AUX",  "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};
};

using PolicyTablesPtr = std::shared_ptr<const PolicyTables>;

// Built-in tables, created on first use and shared for the process lifetime.
PolicyTablesPtr default_policy_tables();

}  // namespace warden::policy
