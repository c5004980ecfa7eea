// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_ERRORS_HPP
#define BULWARK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Bulwark::Core {

    /**
     * @brief A probe needs an external facility (binary, config file, /proc entry)
     * that is not present on this host.
     */
    class ToolMissingError : public std::runtime_error {
    public:
        explicit ToolMissingError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief The process lacks the privilege to read a resource.
     */
    class PermissionDeniedError : public std::runtime_error {
    public:
        explicit PermissionDeniedError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief A mutating action did not complete.
     */
    class RemediationError : public std::runtime_error {
    public:
        explicit RemediationError(const std::string& what) : std::runtime_error(what) {}
    };

    // Invalid command line.
    class UsageError : public std::runtime_error {
    public:
        explicit UsageError(const std::string& what) : std::runtime_error(what) {}
    };

    // APPLY requested without root.
    class PrivilegeError : public std::runtime_error {
    public:
        explicit PrivilegeError(const std::string& what) : std::runtime_error(what) {}
    };
}

#endif
