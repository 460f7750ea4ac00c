#pragma once
/**
 * @file allocation_record.hpp
 * @brief Plain records exchanged between the registry and observability sinks.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "unmanaged/core/error.hpp"

namespace unmanaged::mem {

/// @brief Monotonic id distinguishing successive allocations at the same address.
using AllocationId = std::uint64_t;

/// @brief Wildcard id: matches whatever allocation currently owns an address.
inline constexpr AllocationId kAnyAllocation = 0;

/** @struct LiveAllocation
 *  @brief Snapshot of one registered allocation.
 */
struct LiveAllocation {
    std::uintptr_t address{0};     ///< Native address
    std::size_t    byte_length{0}; ///< Tracked length in bytes
    AllocationId   id{0};          ///< Allocation generation
    Site           site{};         ///< Where it was allocated
};

/** @struct LeakReport
 *  @brief Result of a leak audit: every allocation still live at audit time.
 */
struct LeakReport {
    std::vector<LiveAllocation> leaks;

    bool        empty() const noexcept { return leaks.empty(); }
    std::size_t size()  const noexcept { return leaks.size(); }
};

} // namespace unmanaged::mem
