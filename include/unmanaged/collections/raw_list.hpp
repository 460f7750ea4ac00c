/**
 * @file raw_list.hpp
 * @brief Growable type-erased list: a counted prefix of a resizable buffer.
 *
 * Design:
 *  - Elements live in one MemoryAddress of capacity * element size bytes.
 *  - add/insert on a full list grow the capacity to
 *    max(capacity * LIST_GROWTH_FACTOR, capacity + 1, required count).
 *  - Capacity 0 is allowed; the first add allocates.
 *  - Growth invalidates every span and element pointer taken before it.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "unmanaged/config/constants.hpp"
#include "unmanaged/core/error.hpp"
#include "unmanaged/mem/memory_address.hpp"
#include "unmanaged/types/runtime_type.hpp"

namespace unmanaged::collections {

class RawList final {
public:
  RawList() noexcept = default;

  RawList(const RawList&)            = delete;
  RawList& operator=(const RawList&) = delete;
  RawList(RawList&&) noexcept            = default;
  RawList& operator=(RawList&&) noexcept = default;

  /// @brief Empty list of @p type with room for @p capacity elements.
  static Result<RawList> create(types::RuntimeType type,
                                std::size_t capacity = config::constants::DEFAULT_LIST_CAPACITY,
                                mem::AllocationRegistry& registry = mem::default_registry(),
                                const Site& site = Site::current());

  Status free(const Site& site = Site::current());

  types::RuntimeType element_type() const noexcept { return type_; }
  std::size_t        count()        const noexcept { return count_; }
  std::size_t        capacity()     const noexcept { return capacity_; }
  bool               empty()        const noexcept { return count_ == 0; }
  bool               is_null()      const noexcept { return items_.is_null(); }

  const mem::MemoryAddress& storage() const noexcept { return items_; }

  // --------------------------- Element access --------------------------------
  /// @brief Bytes of element @p index (OutOfBounds when index >= count()).
  Result<std::span<std::byte>> element_bytes(std::size_t index,
                                             const Site& site = Site::current()) const;

  Status set_element_bytes(std::size_t index, std::span<const std::byte> bytes,
                           const Site& site = Site::current());

  /// @brief Copy element @p source_index over element @p destination_index of @p destination.
  Status copy_element_to(std::size_t source_index, RawList& destination,
                         std::size_t destination_index, const Site& site = Site::current()) const;

  /// @brief The first count() elements as one byte span.
  Result<std::span<std::byte>> bytes(const Site& site = Site::current()) const;

  // --------------------------- Mutation --------------------------------------
  /// @brief Append one element; @p bytes must be exactly element_type().size().
  Status add(std::span<const std::byte> bytes, const Site& site = Site::current());

  /// @brief Append a whole number of elements.
  Status add_range(std::span<const std::byte> bytes, const Site& site = Site::current());

  /// @brief Append @p n zeroed elements.
  Status add_default(std::size_t n, const Site& site = Site::current());

  /// @brief Insert before @p index (index == count() appends).
  Status insert(std::size_t index, std::span<const std::byte> bytes,
                const Site& site = Site::current());

  /// @brief Remove element @p index, shifting the tail down (order preserved).
  Status remove_at(std::size_t index, const Site& site = Site::current());

  /// @brief Remove element @p index by moving the last element into its slot.
  Status remove_at_by_swap_back(std::size_t index, const Site& site = Site::current());

  /// @brief Reallocate to exactly @p capacity slots (OutOfBounds if < count()).
  Status set_capacity(std::size_t capacity, const Site& site = Site::current());

  /// @brief Grow so that @p required elements fit.
  Status reserve(std::size_t required, const Site& site = Site::current());

  /// @brief Drop every element; capacity is kept.
  void clear() noexcept { count_ = 0; }

  /// @brief Hash of element type, count and contents.
  Result<std::uint64_t> content_hash(const Site& site = Site::current()) const;

  /// @brief The counted elements as T; TypeMismatch unless element_type() is T's.
  template <class T>
  Result<std::span<T>> as(const Site& site = Site::current()) const {
    if (!type_.is<T>()) return fail(Errc::TypeMismatch, items_.address());
    return items_.view().as_span<T>(0, count_, site);
  }

private:
  Status check_element(std::span<const std::byte> bytes) const;

  types::RuntimeType type_{};
  std::size_t        count_{0};
  std::size_t        capacity_{0};
  mem::MemoryAddress items_{};
};

} // namespace unmanaged::collections
