// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/ConfigTemplates.hpp"

namespace BulwarkTemplates {

    using Bulwark::Core::CheckStatus;

    const std::vector<std::string> TRUSTED_EXEC_DIRS = {
        "/usr/sbin", "/usr/bin", "/sbin", "/bin"
    };

    const std::string TRUSTED_PATH = "/usr/sbin:/usr/bin:/sbin:/bin";

    const std::vector<std::string> UNSAFE_ENV_VARS = {
        "LD_PRELOAD", "LD_LIBRARY_PATH", "PYTHONPATH", "PYTHONHOME"
    };

    const std::vector<SysctlExpectation> SYSCTL_BASELINE = {
        {
            "kernel.ip_forward", "IP forwarding",
            "net.ipv4.ip_forward", "0", {},
            CheckStatus::WARN,
            "IP forwarding is disabled",
            "IP forwarding is enabled (disable unless this is a router)"
        },
        {
            "kernel.accept_redirects", "ICMP redirect acceptance",
            "net.ipv4.conf.all.accept_redirects", "0",
            {"net.ipv4.conf.default.accept_redirects"},
            CheckStatus::FAIL,
            "ICMP redirects are disabled",
            "ICMP redirects should be disabled"
        },
        {
            "kernel.accept_source_route", "Source packet routing",
            "net.ipv4.conf.all.accept_source_route", "0",
            {"net.ipv4.conf.default.accept_source_route"},
            CheckStatus::FAIL,
            "Source packet routing is disabled",
            "Source packet routing should be disabled"
        },
        {
            "kernel.tcp_syncookies", "SYN cookies (SYN flood protection)",
            "net.ipv4.tcp_syncookies", "1", {},
            CheckStatus::FAIL,
            "SYN cookies are enabled",
            "SYN cookies should be enabled"
        }
    };

    // 0640 is the Debian default for shadow (group "shadow").
    const std::vector<FileModeExpectation> FILE_MODE_BASELINE = {
        { "perms.passwd", "/etc/passwd permissions", "passwd", {0644}, 0644 },
        { "perms.shadow", "/etc/shadow permissions", "shadow", {0000, 0400, 0600, 0640}, 0600 },
        { "perms.group",  "/etc/group permissions",  "group",  {0644}, 0644 }
    };

    const std::vector<std::string> RISKY_SERVICES = {
        "telnet", "rsh", "rlogin", "vsftpd", "ftpd"
    };

    const int PASS_MAX_DAYS_LIMIT = 90;
    const int SSH_MAX_AUTH_TRIES = 4;
    const std::size_t WORLD_WRITABLE_REPORT_LIMIT = 10;
}
