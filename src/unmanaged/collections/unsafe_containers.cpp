/**
 * @file unsafe_containers.cpp
 * @brief Explicit template instantiations for the typed containers to reduce code bloat.
 */

#include <cstdint>

#include "unmanaged/collections/unsafe_array.hpp"
#include "unmanaged/collections/unsafe_dictionary.hpp"
#include "unmanaged/collections/unsafe_list.hpp"

namespace unmanaged::collections {

    /// Explicit instantiations for commonly used element types.
    /// One compiled instance instead of every TU instantiating its own.

    template class UnsafeArray<int>;
    template class UnsafeArray<std::uint8_t>;
    template class UnsafeList<int>;
    template class UnsafeList<std::uint32_t>;
    template class UnsafeList<std::uint64_t>;                    // list_bench
    template class UnsafeDictionary<int, int>;
    template class UnsafeDictionary<std::uint64_t, std::uint64_t>; // list_bench
} // namespace unmanaged::collections
