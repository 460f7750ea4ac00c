/**
 * @file memory_address.hpp
 * @brief Owning raw-memory handle (MemoryAddress) and its borrow (MemoryView).
 *
 * Design:
 *  - MemoryAddress is move-only: exactly one owner per allocation.
 *  - Memory is released only by free(). A handle destroyed while live is a
 *    leak and shows up in the registry audit; nothing is reclaimed implicitly.
 *  - Typed access goes through MemoryView, which checks liveness and byte
 *    ranges against the registry when tracking is compiled in.
 *
 * Error model:
 *  - Every operation returns Result<T> / Status (no exceptions).
 *  - Double free of the same handle is reported in every build profile.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <type_traits>

#include "unmanaged/core/error.hpp"
#include "unmanaged/core/traits.hpp"
#include "unmanaged/mem/registry.hpp"
#include "unmanaged/mem/tracking.hpp"

namespace unmanaged::mem {

/**
 * @brief Non-owning view of a live allocation.
 *
 * Valid only while the owning MemoryAddress is neither freed nor resized.
 * Copyable; never frees.
 */
class MemoryView final {
public:
  MemoryView() noexcept = default;

  MemoryView(std::byte* data, std::size_t byte_length, AllocationId id,
             const AllocationRegistry* registry) noexcept
    : data_(data), length_(byte_length), id_(id), registry_(registry) {}

  std::byte*     data()    const noexcept { return data_; }
  std::size_t    length()  const noexcept { return length_; }
  std::uintptr_t address() const noexcept { return reinterpret_cast<std::uintptr_t>(data_); }
  bool           is_null() const noexcept { return data_ == nullptr; }

  /**
   * @brief Read a T stored at @p byte_offset (unaligned access allowed).
   * @return The value, or NotLive / AlreadyDisposed / OutOfBounds.
   */
  template <class T>
  Result<T> read(std::size_t byte_offset, const Site& site = Site::current()) const {
    static_assert(UnmanagedTraits<T>::ok, "read<T>: T must be trivially copyable");
    if (auto st = check(byte_offset, sizeof(T), site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    T out;
    std::memcpy(&out, data_ + byte_offset, sizeof(T));
    return out;
  }

  /// @brief Write @p value at @p byte_offset (unaligned access allowed).
  template <class T>
  Status write(std::size_t byte_offset, const T& value, const Site& site = Site::current()) const {
    static_assert(UnmanagedTraits<T>::ok, "write<T>: T must be trivially copyable");
    if (auto st = check(byte_offset, sizeof(T), site); !st) return st;
    std::memcpy(data_ + byte_offset, &value, sizeof(T));
    return {};
  }

  /**
   * @brief Reinterpret @p count elements of T starting at @p byte_offset.
   * @return span<T>, or OutOfBounds / Misaligned / NotLive / AlreadyDisposed.
   */
  template <class T>
  Result<std::span<T>> as_span(std::size_t byte_offset, std::size_t count,
                               const Site& site = Site::current()) const {
    static_assert(UnmanagedTraits<T>::ok, "as_span<T>: T must be trivially copyable");
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
      return fail(Errc::OutOfBounds, address());
    }
    if (auto st = check(byte_offset, count * sizeof(T), site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    if (auto st = detail::ActiveTracking::require_alignment(address(), byte_offset, alignof(T)); !st) {
      return unmanaged_detail::unexpected<Error>(st.error());
    }
    return std::span<T>(reinterpret_cast<T*>(data_ + byte_offset), count);
  }

  /// @brief Raw bytes in [byte_offset, byte_offset + byte_length).
  Result<std::span<std::byte>> bytes(std::size_t byte_offset, std::size_t byte_length,
                                     const Site& site = Site::current()) const;

  /// @brief Set every byte of the range to @p value.
  Status fill(std::size_t byte_offset, std::size_t byte_length, std::byte value,
              const Site& site = Site::current()) const;
  Status fill(std::byte value, const Site& site = Site::current()) const;

  /// @brief Zero the range (or the whole allocation).
  Status clear(std::size_t byte_offset, std::size_t byte_length,
               const Site& site = Site::current()) const;
  Status clear(const Site& site = Site::current()) const;

  /// @brief Copy @p byte_length bytes into @p destination. Overlap-safe (same allocation allowed).
  Status copy_to(const MemoryView& destination, std::size_t source_offset,
                 std::size_t destination_offset, std::size_t byte_length,
                 const Site& site = Site::current()) const;

  /// @brief Copy @p byte_length bytes from @p source into this view.
  Status copy_from(const MemoryView& source, std::size_t source_offset,
                   std::size_t destination_offset, std::size_t byte_length,
                   const Site& site = Site::current()) const {
    return source.copy_to(*this, source_offset, destination_offset, byte_length, site);
  }

  /// @brief Copy raw bytes (e.g. a stack value) into the view at @p byte_offset.
  Status copy_from(std::span<const std::byte> source, std::size_t byte_offset,
                   const Site& site = Site::current()) const;

private:
  Status check(std::size_t byte_offset, std::size_t size, const Site& site) const {
    return detail::ActiveTracking::require_range(registry_, address(), id_, byte_offset, size, site);
  }

  std::byte*                data_{nullptr};
  std::size_t               length_{0};
  AllocationId              id_{0};
  const AllocationRegistry* registry_{nullptr};
};

/**
 * @brief Exclusively-owned handle to a native allocation.
 */
class MemoryAddress final {
public:
  /// @brief Null handle; every operation on it reports NotLive.
  MemoryAddress() noexcept = default;

  MemoryAddress(const MemoryAddress&)            = delete; ///< Non-copyable
  MemoryAddress& operator=(const MemoryAddress&) = delete; ///< Non-assignable

  MemoryAddress(MemoryAddress&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment. A live handle being overwritten is NOT freed.
  MemoryAddress& operator=(MemoryAddress&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  ~MemoryAddress() = default;

  // --------------------------- Allocation ------------------------------------

  /**
   * @brief Allocate @p byte_length uninitialized bytes.
   * @param registry Registry recording the allocation (tracking builds).
   * @param site Allocation site recorded for leak reports.
   */
  static Result<MemoryAddress> allocate(std::size_t byte_length,
                                        AllocationRegistry& registry = default_registry(),
                                        const Site& site = Site::current());

  /// @brief Allocate @p byte_length zeroed bytes.
  static Result<MemoryAddress> allocate_zeroed(std::size_t byte_length,
                                               AllocationRegistry& registry = default_registry(),
                                               const Site& site = Site::current());

  /// @brief Allocate sizeof(T) bytes holding @p value.
  template <class T>
  static Result<MemoryAddress> allocate_value(const T& value,
                                              AllocationRegistry& registry = default_registry(),
                                              const Site& site = Site::current()) {
    static_assert(UnmanagedTraits<T>::ok, "allocate_value<T>: T must be trivially copyable");
    auto h = allocate(sizeof(T), registry, site);
    if (h) std::memcpy(h->ptr_, &value, sizeof(T));
    return h;
  }

  /// @brief Allocate a copy of @p values.
  template <class T>
  static Result<MemoryAddress> allocate_copy(std::span<const T> values,
                                             AllocationRegistry& registry = default_registry(),
                                             const Site& site = Site::current()) {
    static_assert(UnmanagedTraits<T>::ok, "allocate_copy<T>: T must be trivially copyable");
    auto h = allocate(values.size_bytes(), registry, site);
    if (h && !values.empty()) std::memcpy(h->ptr_, values.data(), values.size_bytes());
    return h;
  }

  /**
   * @brief Release the allocation.
   * @return NotLive for a null handle, AlreadyDisposed (with the prior disposal
   *         site when tracked) if this handle was freed before.
   */
  Status free(const Site& site = Site::current());

  /**
   * @brief Reallocate to @p new_byte_length bytes, preserving min(old, new) bytes.
   * New bytes are uninitialized. The address may change; views taken before
   * the call are invalid afterwards. On failure the handle is unchanged.
   */
  static Status resize(MemoryAddress& handle, std::size_t new_byte_length,
                       const Site& site = Site::current());

  // --------------------------- Observers -------------------------------------

  std::byte*          data()     const noexcept { return ptr_; }
  std::uintptr_t      address()  const noexcept { return reinterpret_cast<std::uintptr_t>(ptr_); }
  std::size_t         length()   const noexcept { return length_; }
  AllocationId        id()       const noexcept { return id_; }
  AllocationRegistry* registry() const noexcept { return registry_; }
  bool                is_null()  const noexcept { return ptr_ == nullptr; }
  bool                is_freed() const noexcept { return freed_; }

  /// @brief Borrow the allocation.
  MemoryView view() const noexcept {
    return MemoryView(ptr_, length_, id_, registry_);
  }

  // --------------------------- Typed access (forwarded to view) ---------------

  template <class T>
  Result<T> read(std::size_t byte_offset, const Site& site = Site::current()) const {
    return view().read<T>(byte_offset, site);
  }

  template <class T>
  Status write(std::size_t byte_offset, const T& value, const Site& site = Site::current()) const {
    return view().write<T>(byte_offset, value, site);
  }

  template <class T>
  Result<std::span<T>> as_span(std::size_t byte_offset, std::size_t count,
                               const Site& site = Site::current()) const {
    return view().as_span<T>(byte_offset, count, site);
  }

  Status fill(std::byte value, const Site& site = Site::current()) const {
    return view().fill(value, site);
  }

  Status clear(const Site& site = Site::current()) const {
    return view().clear(site);
  }

  Status copy_to(const MemoryAddress& destination, std::size_t byte_length,
                 const Site& site = Site::current()) const {
    return view().copy_to(destination.view(), 0, 0, byte_length, site);
  }

  Status copy_from(const MemoryAddress& source, std::size_t byte_length,
                   const Site& site = Site::current()) const {
    return view().copy_from(source.view(), 0, 0, byte_length, site);
  }

private:
  static Result<MemoryAddress> adopt(void* ptr, std::size_t byte_length,
                                     AllocationRegistry& registry, const Site& site);

  void move_from(MemoryAddress&& other) noexcept {
    ptr_      = other.ptr_;
    length_   = other.length_;
    id_       = other.id_;
    registry_ = other.registry_;
    freed_    = other.freed_;
    other.ptr_      = nullptr;
    other.length_   = 0;
    other.id_       = 0;
    other.registry_ = nullptr;
    other.freed_    = false;
  }

  std::byte*          ptr_{nullptr};      ///< Native pointer; kept after free for diagnostics
  std::size_t         length_{0};         ///< Tracked byte length
  AllocationId        id_{0};             ///< Registry generation (0 when untracked)
  AllocationRegistry* registry_{nullptr}; ///< Registry that recorded the allocation
  bool                freed_{false};      ///< free() succeeded on this handle
};

} // namespace unmanaged::mem
