/**
 * @file unsafe_list.hpp
 * @brief Growable typed list over a RawList.
 *
 * Construction:
 *  - UnsafeList<T>::create(capacity) or create(span).
 *  - from_raw() adopts a type-erased RawList after checking its RuntimeType.
 *
 * Spans and element pointers are invalidated by any operation that grows
 * the list (add, insert, add_range, add_default, set_capacity).
 *
 * @tparam T Trivially copyable element type.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <utility>

#include "unmanaged/collections/raw_list.hpp"
#include "unmanaged/core/traits.hpp"

namespace unmanaged::collections {

template <class T>
class UnsafeList final {
  static_assert(UnmanagedTraits<T>::ok, "UnsafeList<T>: T must be trivially copyable");

public:
  using value_type = T;

  UnsafeList() noexcept = default;

  UnsafeList(const UnsafeList&)            = delete;
  UnsafeList& operator=(const UnsafeList&) = delete;
  UnsafeList(UnsafeList&&) noexcept            = default;
  UnsafeList& operator=(UnsafeList&&) noexcept = default;

  static Result<UnsafeList> create(std::size_t capacity = config::constants::DEFAULT_LIST_CAPACITY,
                                   mem::AllocationRegistry& registry = mem::default_registry(),
                                   const Site& site = Site::current()) {
    auto type = types::RuntimeType::lookup<T>();
    if (!type) return unmanaged_detail::unexpected<Error>(type.error());
    auto list = RawList::create(*type, capacity, registry, site);
    if (!list) return unmanaged_detail::unexpected<Error>(list.error());
    return UnsafeList(std::move(*list));
  }

  /// @brief List holding a copy of @p values, capacity == values.size().
  static Result<UnsafeList> create(std::span<const T> values,
                                   mem::AllocationRegistry& registry = mem::default_registry(),
                                   const Site& site = Site::current()) {
    auto list = create(values.size(), registry, site);
    if (!list) return list;
    if (auto st = list->add_range(values, site); !st) {
      if (auto released = list->free(site); !released) {
        return unmanaged_detail::unexpected<Error>(released.error());
      }
      return unmanaged_detail::unexpected<Error>(st.error());
    }
    return list;
  }

  /// @brief Adopt a type-erased list; TypeMismatch (list untouched) unless it stores T.
  static Result<UnsafeList> from_raw(RawList&& list) {
    if (!list.element_type().template is<T>()) {
      return fail(Errc::TypeMismatch, list.storage().address());
    }
    return UnsafeList(std::move(list));
  }

  Status free(const Site& site = Site::current()) { return list_.free(site); }

  std::size_t count()    const noexcept { return list_.count(); }
  std::size_t capacity() const noexcept { return list_.capacity(); }
  bool        empty()    const noexcept { return list_.empty(); }
  bool        is_null()  const noexcept { return list_.is_null(); }

  const RawList& raw() const noexcept { return list_; }

  // --------------------------- Element access --------------------------------
  Result<T> get(std::size_t index, const Site& site = Site::current()) const {
    auto bytes = list_.element_bytes(index, site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    T out;
    std::memcpy(&out, bytes->data(), sizeof(T));
    return out;
  }

  Status set(std::size_t index, const T& value, const Site& site = Site::current()) {
    return list_.set_element_bytes(index, as_bytes_of(value), site);
  }

  /// @brief Pointer to element @p index; invalidated when the list grows.
  Result<T*> get_ref(std::size_t index, const Site& site = Site::current()) const {
    auto bytes = list_.element_bytes(index, site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    return reinterpret_cast<T*>(bytes->data());
  }

  /// @brief The first count() elements.
  Result<std::span<T>> as_span(const Site& site = Site::current()) const {
    return list_.template as<T>(site);
  }

  /// @brief Elements [start, count()); OutOfBounds unless start < count().
  Result<std::span<T>> as_span(std::size_t start, const Site& site = Site::current()) const {
    if (start >= count()) return fail(Errc::OutOfBounds, list_.storage().address());
    auto items = as_span(site);
    if (!items) return items;
    return items->subspan(start);
  }

  /// @brief Elements [start, start + length); OutOfBounds past count().
  Result<std::span<T>> as_span(std::size_t start, std::size_t length,
                               const Site& site = Site::current()) const {
    if (start > count() || length > count() - start) {
      return fail(Errc::OutOfBounds, list_.storage().address());
    }
    auto items = as_span(site);
    if (!items) return items;
    return items->subspan(start, length);
  }

  /// @brief Overwrite element @p destination_index of @p destination with element @p source_index.
  Status copy_to(std::size_t source_index, UnsafeList& destination, std::size_t destination_index,
                 const Site& site = Site::current()) const {
    return list_.copy_element_to(source_index, destination.list_, destination_index, site);
  }

  /// @brief Copy elements [source_index, count()) into @p destination from @p destination_index.
  Status copy_to(std::size_t source_index, std::span<T> destination, std::size_t destination_index,
                 const Site& site = Site::current()) const {
    auto tail = as_span(source_index, site);
    if (!tail) return unmanaged_detail::unexpected<Error>(tail.error());
    if (destination_index > destination.size() || tail->size() > destination.size() - destination_index) {
      return fail(Errc::OutOfBounds, list_.storage().address());
    }
    if (!tail->empty()) {
      std::memmove(destination.data() + destination_index, tail->data(), tail->size_bytes());
    }
    return {};
  }
  /// @brief First index whose bytes equal @p value, nullopt when absent.
  Result<std::optional<std::size_t>> try_index_of(const T& value,
                                                  const Site& site = Site::current()) const {
    auto items = as_span(site);
    if (!items) return unmanaged_detail::unexpected<Error>(items.error());
    for (std::size_t i = 0; i < items->size(); ++i) {
      if (std::memcmp(&(*items)[i], &value, sizeof(T)) == 0) return std::optional<std::size_t>(i);
    }
    return std::optional<std::size_t>{};
  }

  /// @brief First index holding @p value; KeyNotFound when absent.
  Result<std::size_t> index_of(const T& value, const Site& site = Site::current()) const {
    auto found = try_index_of(value, site);
    if (!found) return unmanaged_detail::unexpected<Error>(found.error());
    if (!found->has_value()) return fail(Errc::KeyNotFound, list_.storage().address());
    return **found;
  }

  Result<bool> contains(const T& value, const Site& site = Site::current()) const {
    auto found = try_index_of(value, site);
    if (!found) return unmanaged_detail::unexpected<Error>(found.error());
    return found->has_value();
  }

  // --------------------------- Mutation --------------------------------------
  /// @brief Append @p value; it may refer to an element of this list.
  Status add(const T& value, const Site& site = Site::current()) {
    return list_.add(as_bytes_of(value), site);
  }

  Status add_range(std::span<const T> values, const Site& site = Site::current()) {
    return list_.add_range(std::as_bytes(values), site);
  }

  /// @brief Append @p n zero-initialized elements.
  Status add_default(std::size_t n = 1, const Site& site = Site::current()) {
    return list_.add_default(n, site);
  }

  Status insert(std::size_t index, const T& value, const Site& site = Site::current()) {
    return list_.insert(index, as_bytes_of(value), site);
  }

  /// @brief Remove element @p index preserving order; returns the removed value.
  Result<T> remove_at(std::size_t index, const Site& site = Site::current()) {
    auto removed = get(index, site);
    if (!removed) return removed;
    if (auto st = list_.remove_at(index, site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    return removed;
  }

  /// @brief Remove the first element equal to @p value; returns its index, KeyNotFound when absent.
  Result<std::size_t> remove(const T& value, const Site& site = Site::current()) {
    auto index = index_of(value, site);
    if (!index) return index;
    if (auto st = list_.remove_at(*index, site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    return index;
  }

  /// @brief Remove element @p index by moving the last element into it; returns the removed value.
  Result<T> remove_at_by_swap_back(std::size_t index, const Site& site = Site::current()) {
    auto removed = get(index, site);
    if (!removed) return removed;
    if (auto st = list_.remove_at_by_swap_back(index, site); !st) {
      return unmanaged_detail::unexpected<Error>(st.error());
    }
    return removed;
  }

  Status set_capacity(std::size_t capacity, const Site& site = Site::current()) {
    return list_.set_capacity(capacity, site);
  }

  void clear() noexcept { list_.clear(); }

  Result<std::uint64_t> content_hash(const Site& site = Site::current()) const {
    return list_.content_hash(site);
  }

private:
  explicit UnsafeList(RawList&& list) noexcept : list_(std::move(list)) {}

  static std::span<const std::byte> as_bytes_of(const T& value) noexcept {
    return std::as_bytes(std::span<const T, 1>(&value, 1));
  }

  RawList list_{};
};

} // namespace unmanaged::collections
