#pragma once
/**
 * @file traits.hpp
 * @brief Element-type constraints for raw memory access.
 */

#include <type_traits>

namespace unmanaged {

/// @brief Types that may be read/written as raw bytes.
template <class T>
struct UnmanagedTraits {
    static constexpr bool ok =
        std::is_trivially_copyable_v<T> && !std::is_reference_v<T>;
};

/// @brief Types usable as hashed dictionary keys: equal values have equal bytes.
template <class T>
struct KeyTraits {
    static constexpr bool ok =
        UnmanagedTraits<T>::ok && std::has_unique_object_representations_v<T>;
};

} // namespace unmanaged
