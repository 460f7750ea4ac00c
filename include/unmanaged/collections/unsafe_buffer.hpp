// =============================================================
// File: include/unmanaged/collections/unsafe_buffer.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <span>

#include "unmanaged/core/error.hpp"
#include "unmanaged/mem/memory_address.hpp"
#include "unmanaged/types/runtime_type.hpp"

namespace unmanaged::collections {

/**
 * @file unsafe_buffer.hpp
 * @brief Fixed-length, type-erased element storage stamped with a RuntimeType.
 *
 * Design:
 *  - Elements are addressed by index; each is element_type().size() bytes.
 *  - Typed reinterpretation (as<T>) is rejected with TypeMismatch unless the
 *    stored descriptor is T's.
 *  - Index errors are reported in every build profile.
 *  - Released only by free(); move-only like the MemoryAddress it wraps.
 */
class UnsafeBuffer final {
public:
  UnsafeBuffer() noexcept = default;

  UnsafeBuffer(const UnsafeBuffer&)            = delete;
  UnsafeBuffer& operator=(const UnsafeBuffer&) = delete;
  UnsafeBuffer(UnsafeBuffer&&) noexcept            = default;
  UnsafeBuffer& operator=(UnsafeBuffer&&) noexcept = default;

  /**
   * @brief Allocate @p length zeroed elements of @p type.
   * @return ZeroCapacity for length 0, TypeMismatch for the "no type" descriptor.
   */
  static Result<UnsafeBuffer> create(types::RuntimeType type, std::size_t length,
                                     mem::AllocationRegistry& registry = mem::default_registry(),
                                     const Site& site = Site::current());

  /// @brief Release the storage.
  Status free(const Site& site = Site::current());

  types::RuntimeType element_type() const noexcept { return type_; }
  std::size_t        length()       const noexcept { return length_; }
  std::size_t        byte_length()  const noexcept { return length_ * type_.size(); }
  bool               is_null()      const noexcept { return storage_.is_null(); }

  const mem::MemoryAddress& storage() const noexcept { return storage_; }
  mem::MemoryView           view()    const noexcept { return storage_.view(); }

  /// @brief Bytes of element @p index (OutOfBounds when index >= length()).
  Result<std::span<std::byte>> element_bytes(std::size_t index,
                                             const Site& site = Site::current()) const;

  /// @brief Overwrite element @p index; @p bytes must be exactly one element.
  Status set_element_bytes(std::size_t index, std::span<const std::byte> bytes,
                           const Site& site = Site::current());

  /// @brief Copy one element into @p destination (same element type required).
  Status copy_element_to(std::size_t source_index, const UnsafeBuffer& destination,
                         std::size_t destination_index,
                         const Site& site = Site::current()) const;

  /**
   * @brief Change the length through MemoryAddress::resize.
   * @param zero_new_slots Zero the slots past the old length when growing.
   */
  Status resize(std::size_t new_length, bool zero_new_slots = true,
                const Site& site = Site::current());

  /// @brief Zero every element.
  Status clear(const Site& site = Site::current());

  /// @brief All elements as T; TypeMismatch unless element_type() is T's.
  template <class T>
  Result<std::span<T>> as(const Site& site = Site::current()) const {
    if (!type_.is<T>()) return fail(Errc::TypeMismatch, storage_.address());
    return storage_.view().as_span<T>(0, length_, site);
  }

private:
  types::RuntimeType type_{};
  std::size_t        length_{0};
  mem::MemoryAddress storage_{};
};

} // namespace unmanaged::collections
