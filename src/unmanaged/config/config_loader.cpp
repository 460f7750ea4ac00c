/**
* @file config_loader.cpp
 * @brief Loader returning named defaults with environment overrides.
 */
#include "unmanaged/config/config_loader.hpp"

#include <cstdlib>

namespace unmanaged::config {

    RuntimeConfig Loader::defaults() {
        return RuntimeConfig{};
    }

    std::optional<mem::LeakPolicy> Loader::parse_leak_policy(std::string_view text) {
        if (text == "abort")  return mem::LeakPolicy::Abort;
        if (text == "report") return mem::LeakPolicy::Report;
        return std::nullopt;
    }

    std::optional<bool> Loader::parse_flag(std::string_view text) {
        if (text == "1" || text == "true" || text == "on")   return true;
        if (text == "0" || text == "false" || text == "off") return false;
        return std::nullopt;
    }

    RuntimeConfig Loader::load_from_env() {
        RuntimeConfig rc = defaults();
        if (const char* v = std::getenv("UNMANAGED_LEAK_POLICY")) {
            if (auto p = parse_leak_policy(v)) rc.leak_policy = *p;
        }
        if (const char* v = std::getenv("UNMANAGED_REPORT_FAULTS")) {
            if (auto f = parse_flag(v)) rc.report_faults = *f;
        }
        return rc;
    }

    mem::RegistryConfig Loader::to_registry_config(const RuntimeConfig& rc, obs::Observer* observer) {
        mem::RegistryConfig cfg;
        cfg.leak_policy   = rc.leak_policy;
        cfg.report_faults = rc.report_faults;
        cfg.observer      = observer;
        return cfg;
    }

} // namespace unmanaged::config
