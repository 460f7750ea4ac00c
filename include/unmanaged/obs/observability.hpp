#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: fault events, leak reports and counters.
 */

#include <cstdint>
#include <string>

#include "unmanaged/core/error.hpp"
#include "unmanaged/mem/allocation_record.hpp"

namespace unmanaged::obs {

    /** @struct Counters
     *  @brief Process-level counters for registry diagnostics.
     */
    struct Counters {
        uint64_t faults{0};             ///< Errors reported by the registry
        uint64_t leak_audits{0};        ///< Audits that found at least one leak
        uint64_t leaked_allocations{0}; ///< Sum of leaked allocations across audits
    };

    /** @struct FaultEvent
     *  @brief Payload describing a single rejected registry operation.
     */
    struct FaultEvent {
        Error       error{};       ///< What was rejected
        const char* operation{""}; ///< Registry operation name ("unregister", ...)
        Site        caller{};      ///< Site of the rejected call
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a rejected operation.
        virtual void record(const FaultEvent& e) = 0;
        /// Record a non-empty leak audit.
        virtual void record(const mem::LeakReport& r) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Render a leak report as the multi-line text printed at teardown.
    std::string format_leak_report(const mem::LeakReport& r);

    // Process-wide printf-backed observer (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace unmanaged::obs
