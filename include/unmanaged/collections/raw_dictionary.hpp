/**
 * @file raw_dictionary.hpp
 * @brief Type-erased hash map with open addressing and linear probing.
 *
 * Layout: three parallel allocations of capacity slots each
 *  - keys   : capacity * key size bytes
 *  - values : capacity * value size bytes
 *  - states : one SlotState byte per slot
 *
 * Keys hash as FNV-1a over their bytes seeded with the key RuntimeType and
 * compare with memcmp, so key types need unique object representations.
 * Capacity is a power of two; the table is rebuilt when occupied + removed
 * slots would exceed DICTIONARY_MAX_LOAD_NUM / DICTIONARY_MAX_LOAD_DEN.
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

/// Occupancy marker stored per slot.
enum class SlotState : std::uint8_t {
  Empty    = 0,
  Occupied = 1,
  Removed  = 2  ///< Tombstone: keeps probe chains intact after remove()
};

class RawDictionary final {
public:
  RawDictionary() noexcept = default;

  RawDictionary(const RawDictionary&)            = delete;
  RawDictionary& operator=(const RawDictionary&) = delete;
  RawDictionary(RawDictionary&&) noexcept            = default;
  RawDictionary& operator=(RawDictionary&&) noexcept = default;

  /**
   * @brief Empty dictionary with at least @p capacity slots (rounded up to a power of two).
   * @return ZeroCapacity for capacity 0, TypeMismatch for an invalid descriptor.
   */
  static Result<RawDictionary> create(types::RuntimeType key_type, types::RuntimeType value_type,
                                      std::size_t capacity = config::constants::DEFAULT_DICTIONARY_CAPACITY,
                                      mem::AllocationRegistry& registry = mem::default_registry(),
                                      const Site& site = Site::current());

  /// @brief Release all three allocations. Reports the first failure.
  Status free(const Site& site = Site::current());

  types::RuntimeType key_type()   const noexcept { return key_type_; }
  types::RuntimeType value_type() const noexcept { return value_type_; }
  std::size_t        count()      const noexcept { return count_; }
  std::size_t        capacity()   const noexcept { return capacity_; }
  std::size_t        tombstones() const noexcept { return removed_; }
  bool               empty()      const noexcept { return count_ == 0; }
  bool               is_null()    const noexcept { return keys_.is_null(); }

  const mem::MemoryAddress& key_storage() const noexcept { return keys_; }

  /// @brief Insert; DuplicateKey if @p key is present.
  Status add(std::span<const std::byte> key, std::span<const std::byte> value,
             const Site& site = Site::current());

  /// @brief Insert or overwrite.
  Status set(std::span<const std::byte> key, std::span<const std::byte> value,
             const Site& site = Site::current());

  Result<bool> contains_key(std::span<const std::byte> key, const Site& site = Site::current()) const;

  /// @brief Value bytes stored for @p key; KeyNotFound when absent. Invalidated by growth.
  Result<std::span<std::byte>> value_bytes(std::span<const std::byte> key,
                                           const Site& site = Site::current()) const;

  /// @brief Remove @p key; KeyNotFound when absent.
  Status remove(std::span<const std::byte> key, const Site& site = Site::current());

  /// @brief Mark every slot empty; capacity is kept.
  Status clear(const Site& site = Site::current());

  /// @brief Call fn(key_bytes, value_bytes) for every occupied slot, in slot order.
  template <class Fn>
  Status for_each(Fn&& fn, const Site& site = Site::current()) const {
    auto s = slots(site);
    if (!s) return unmanaged_detail::unexpected<Error>(s.error());
    const std::size_t ksize = key_type_.size();
    const std::size_t vsize = value_type_.size();
    for (std::size_t i = 0; i < capacity_; ++i) {
      if (static_cast<SlotState>(s->states[i]) != SlotState::Occupied) continue;
      fn(std::span<const std::byte>(s->keys.subspan(i * ksize, ksize)),
         s->values.subspan(i * vsize, vsize));
    }
    return {};
  }

private:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  /// Checked views over the three allocations.
  struct Slots {
    std::span<std::byte> keys;
    std::span<std::byte> values;
    std::span<std::byte> states;
  };

  /// Result of a probe: the slot holding the key, or where it would go.
  struct Probe {
    std::size_t found{npos};
    std::size_t insert_at{npos};
  };

  static Result<Slots> view_slots(const mem::MemoryAddress& keys, const mem::MemoryAddress& values,
                                  const mem::MemoryAddress& states, const Site& site);

  Result<Slots> slots(const Site& site) const;
  Status        check_key(std::span<const std::byte> key) const;
  Status        check_value(std::span<const std::byte> value) const;
  std::uint64_t hash_key(std::span<const std::byte> key) const noexcept;
  Probe         probe(const Slots& s, std::size_t capacity,
                      std::span<const std::byte> key) const noexcept;
  Status        rehash(std::size_t new_capacity, const Site& site);
  Status        insert_new(std::span<const std::byte> key, std::span<const std::byte> value,
                           const Site& site);

  types::RuntimeType       key_type_{};
  types::RuntimeType       value_type_{};
  std::size_t              count_{0};
  std::size_t              removed_{0};
  std::size_t              capacity_{0};
  mem::MemoryAddress       keys_{};
  mem::MemoryAddress       values_{};
  mem::MemoryAddress       states_{};
  mem::AllocationRegistry* registry_{nullptr};
};

} // namespace unmanaged::collections
