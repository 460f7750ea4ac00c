#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for handles, registry and containers.
 * @details These values eliminate magic numbers from the codebase. Runtime policy
 *          (leak handling, fault reporting) is layered on top by the Config Loader.
 */

#include <cstddef>
#include <cstdint>

/// Build-time toggle. Set by the build (CMake option UNMANAGED_TRACK_ALLOCATIONS).
#ifndef UNMANAGED_TRACK_ALLOCATIONS
#define UNMANAGED_TRACK_ALLOCATIONS 1
#endif

namespace unmanaged::config {

/// true: registry bookkeeping, site capture, liveness and byte-range checks.
/// false: all of the above compiled out; violations are undefined behavior.
inline constexpr bool track_allocations = (UNMANAGED_TRACK_ALLOCATIONS != 0);

} // namespace unmanaged::config

namespace unmanaged::config::constants {

// =====================
// List defaults
// =====================
inline constexpr std::size_t DEFAULT_LIST_CAPACITY = 1;  ///< Capacity when none is given
inline constexpr std::size_t LIST_GROWTH_FACTOR    = 2;  ///< Capacity multiplier on a full add/insert

// =====================
// Dictionary defaults (open addressing, power-of-two slot counts)
// =====================
inline constexpr std::size_t DEFAULT_DICTIONARY_CAPACITY = 16; ///< Initial slot count
inline constexpr std::size_t DICTIONARY_MAX_LOAD_NUM     = 3;  ///< Grow when used slots exceed 3/4
inline constexpr std::size_t DICTIONARY_MAX_LOAD_DEN     = 4;

// =====================
// Hashing
// =====================
inline constexpr std::uint64_t HASH_SEED        = 0xcbf29ce484222325ULL; ///< FNV-1a offset basis
inline constexpr std::uint64_t HASH_PRIME       = 0x100000001b3ULL;      ///< FNV-1a prime
inline constexpr std::uint32_t TYPE_ID_REHASH   = 174440041u;            ///< Step applied on type id collision

// =====================
// Registry
// =====================
inline constexpr std::size_t REGISTRY_RESERVE = 256; ///< Initial bucket reservation for the live table

} // namespace unmanaged::config::constants
