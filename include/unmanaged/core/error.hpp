#pragma once
/**
 * @file error.hpp
 * @brief Error codes and result aliases shared by handles, registry and containers.
 * @details Every failure is returned as a value (never thrown). Callers check the
 *          expected<> and decide; nothing is retried or recovered internally.
 */

#include <cstdint>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>

#include "unmanaged/compat/expected.hpp"  // unmanaged_detail::expected / unexpected

namespace unmanaged {

/// @brief Source position recorded for allocations, disposals and faults.
using Site = std::source_location;

/**
 * @brief Failure categories reported by the library.
 */
enum class Errc : std::uint8_t {
    NotLive = 1,          ///< Address was never registered (default or foreign handle)
    AlreadyDisposed,      ///< Address was freed before; site names the disposal
    DoubleRegistration,   ///< Address registered twice; site names the first allocation
    OutOfBounds,          ///< Index or byte range beyond the tracked length
    Misaligned,           ///< Byte offset not a multiple of the element alignment
    TypeMismatch,         ///< Stored RuntimeType differs from the requested type
    DuplicateKey,         ///< Dictionary already holds the key
    KeyNotFound,          ///< Dictionary has no entry for the key, or list/array lacks the item
    ZeroCapacity,         ///< Container created with length/capacity zero
    AllocationFailed,     ///< The system allocator returned null
    TypeTableFull         ///< Every 16-bit RuntimeType id is already assigned
};

/**
 * @struct Error
 * @brief Failure payload: what went wrong, where, and the related site.
 */
struct Error {
    Errc           code{Errc::NotLive};
    std::uintptr_t address{0};   ///< Address involved, 0 when not applicable
    Site           site{};       ///< Prior disposal/allocation site when known

    friend bool operator==(const Error& e, Errc c) noexcept { return e.code == c; }
};

template <class T>
using Result = unmanaged_detail::expected<T, Error>;

using Status = unmanaged_detail::expected<void, Error>;

/// @brief Build an unexpected<Error> for early returns.
inline unmanaged_detail::unexpected<Error>
fail(Errc code, std::uintptr_t address = 0, const Site& site = Site{}) noexcept {
    return unmanaged_detail::unexpected<Error>(Error{code, address, site});
}

/// @brief Stable name of an error code (e.g. "AlreadyDisposed").
std::string_view to_string(Errc code) noexcept;

inline std::ostream& operator<<(std::ostream& os, Errc code) { return os << to_string(code); }

/// @brief Human-readable one-line description including address and site.
std::string describe(const Error& e);

/// @brief Formats a site as "file:line (function)"; empty when unknown.
std::string format_site(const Site& site);

} // namespace unmanaged
