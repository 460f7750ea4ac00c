#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults overridden by environment variables.
 * @details Recognized variables:
 *          - UNMANAGED_LEAK_POLICY   = abort | report
 *          - UNMANAGED_REPORT_FAULTS = 0 | 1
 *          Unrecognized values keep the default.
 */

#include <optional>
#include <string_view>

#include "unmanaged/mem/registry.hpp"

namespace unmanaged::config {

    /** @struct RuntimeConfig
     *  @brief Runtime policy for the process-wide registry.
     */
    struct RuntimeConfig {
        mem::LeakPolicy leak_policy{mem::LeakPolicy::Abort}; ///< Teardown behavior on leaks
        bool            report_faults{true};                ///< Log rejected operations
    };

    /** @class Loader
     *  @brief Source of runtime configuration (defaults or environment).
     */
    class Loader {
    public:
        /// @brief Named defaults only.
        static RuntimeConfig defaults();

        /**
         * @brief Defaults overridden by UNMANAGED_* environment variables.
         * @return RuntimeConfig with every recognized override applied.
         */
        static RuntimeConfig load_from_env();

        /// @brief "abort" / "report" (case-sensitive); nullopt otherwise.
        static std::optional<mem::LeakPolicy> parse_leak_policy(std::string_view text);

        /// @brief "0"/"false"/"off" and "1"/"true"/"on"; nullopt otherwise.
        static std::optional<bool> parse_flag(std::string_view text);

        /// @brief Registry construction parameters for @p rc.
        static mem::RegistryConfig to_registry_config(const RuntimeConfig& rc,
                                                      obs::Observer* observer = nullptr);
    };

} // namespace unmanaged::config
