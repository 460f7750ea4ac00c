#pragma once
/**
 * @file tracking.hpp
 * @brief Checked / unchecked hooks selected once by config::track_allocations.
 *
 * MemoryAddress and MemoryView call these hooks unconditionally. With tracking
 * on, they talk to the AllocationRegistry; with tracking off, they are empty
 * inline functions the optimizer removes.
 */

#include <cstddef>
#include <cstdint>

#include "unmanaged/config/constants.hpp"
#include "unmanaged/core/error.hpp"
#include "unmanaged/mem/registry.hpp"

namespace unmanaged::mem::detail {

template <bool Tracked>
struct Tracking;

template <>
struct Tracking<true> {
    static constexpr bool enabled = true;

    static Result<AllocationId> on_allocate(AllocationRegistry& reg, std::uintptr_t address,
                                            std::size_t byte_length, const Site& site) {
        return reg.register_address(address, byte_length, site);
    }

    static Status on_free(AllocationRegistry& reg, std::uintptr_t address, AllocationId id,
                          const Site& site) {
        return reg.unregister(address, site, id);
    }

    static Status on_resize(AllocationRegistry& reg, std::uintptr_t old_address, AllocationId id,
                            std::uintptr_t new_address, std::size_t new_length, const Site& site) {
        return reg.relocate(old_address, id, new_address, new_length, site);
    }

    static Status require_live(const AllocationRegistry* reg, std::uintptr_t address,
                               AllocationId id, const Site& site) {
        if (reg == nullptr) return fail(Errc::NotLive, address);
        return reg->require_live(address, id, site);
    }

    static Status require_range(const AllocationRegistry* reg, std::uintptr_t address,
                                AllocationId id, std::size_t offset, std::size_t size,
                                const Site& site) {
        if (reg == nullptr) return fail(Errc::NotLive, address);
        return reg->require_range(address, id, offset, size, site);
    }

    static Status require_alignment(std::uintptr_t address, std::size_t offset,
                                    std::size_t alignment) {
        if (((address + offset) % alignment) != 0) return fail(Errc::Misaligned, address);
        return {};
    }
};

template <>
struct Tracking<false> {
    static constexpr bool enabled = false;

    static Result<AllocationId> on_allocate(AllocationRegistry&, std::uintptr_t, std::size_t,
                                            const Site&) noexcept {
        return AllocationId{0};
    }
    static Status on_free(AllocationRegistry&, std::uintptr_t, AllocationId, const Site&) noexcept {
        return {};
    }
    static Status on_resize(AllocationRegistry&, std::uintptr_t, AllocationId, std::uintptr_t,
                            std::size_t, const Site&) noexcept {
        return {};
    }
    static Status require_live(const AllocationRegistry*, std::uintptr_t, AllocationId,
                               const Site&) noexcept {
        return {};
    }
    static Status require_range(const AllocationRegistry*, std::uintptr_t, AllocationId,
                                std::size_t, std::size_t, const Site&) noexcept {
        return {};
    }
    static Status require_alignment(std::uintptr_t, std::size_t, std::size_t) noexcept {
        return {};
    }
};

using ActiveTracking = Tracking<config::track_allocations>;

} // namespace unmanaged::mem::detail
