/**
 * @file unsafe_array.hpp
 * @brief Fixed-length typed array over an UnsafeBuffer.
 *
 * Construction:
 *  - UnsafeArray<T>::create(length) or create(span) to build.
 *  - from_raw() adopts a type-erased buffer after checking its RuntimeType.
 *
 * Element equality (index_of / contains) compares object bytes.
 *
 * @tparam T Trivially copyable element type.
 */
#pragma once

#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <utility>

#include "unmanaged/collections/unsafe_buffer.hpp"
#include "unmanaged/core/traits.hpp"

namespace unmanaged::collections {

template <class T>
class UnsafeArray final {
  static_assert(UnmanagedTraits<T>::ok, "UnsafeArray<T>: T must be trivially copyable");

public:
  using value_type = T;

  UnsafeArray() noexcept = default;

  UnsafeArray(const UnsafeArray&)            = delete;
  UnsafeArray& operator=(const UnsafeArray&) = delete;
  UnsafeArray(UnsafeArray&&) noexcept            = default;
  UnsafeArray& operator=(UnsafeArray&&) noexcept = default;

  /// @brief @p length zero-initialized elements; ZeroCapacity when length is 0.
  static Result<UnsafeArray> create(std::size_t length,
                                    mem::AllocationRegistry& registry = mem::default_registry(),
                                    const Site& site = Site::current()) {
    auto type = types::RuntimeType::lookup<T>();
    if (!type) return unmanaged_detail::unexpected<Error>(type.error());
    auto buffer = UnsafeBuffer::create(*type, length, registry, site);
    if (!buffer) return unmanaged_detail::unexpected<Error>(buffer.error());
    return UnsafeArray(std::move(*buffer));
  }

  /// @brief Copy of @p values.
  static Result<UnsafeArray> create(std::span<const T> values,
                                    mem::AllocationRegistry& registry = mem::default_registry(),
                                    const Site& site = Site::current()) {
    auto array = create(values.size(), registry, site);
    if (!array) return array;
    if (auto st = array->buffer_.view().copy_from(std::as_bytes(values), 0, site); !st) {
      if (auto released = array->free(site); !released) {
        return unmanaged_detail::unexpected<Error>(released.error());
      }
      return unmanaged_detail::unexpected<Error>(st.error());
    }
    return array;
  }

  /**
   * @brief Adopt a type-erased buffer.
   * @return TypeMismatch (buffer untouched) unless it stores T.
   */
  static Result<UnsafeArray> from_raw(UnsafeBuffer&& buffer) {
    if (!buffer.element_type().template is<T>()) {
      return fail(Errc::TypeMismatch, buffer.storage().address());
    }
    return UnsafeArray(std::move(buffer));
  }

  Status free(const Site& site = Site::current()) { return buffer_.free(site); }

  std::size_t length()  const noexcept { return buffer_.length(); }
  bool        is_null() const noexcept { return buffer_.is_null(); }

  /// @brief Underlying type-erased storage.
  const UnsafeBuffer& raw() const noexcept { return buffer_; }

  Result<T> get(std::size_t index, const Site& site = Site::current()) const {
    auto bytes = buffer_.element_bytes(index, site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    T out;
    std::memcpy(&out, bytes->data(), sizeof(T));
    return out;
  }

  Status set(std::size_t index, const T& value, const Site& site = Site::current()) {
    return buffer_.set_element_bytes(index, std::as_bytes(std::span<const T, 1>(&value, 1)), site);
  }

  /// @brief Pointer into the storage; invalidated by resize() and free().
  Result<T*> get_ref(std::size_t index, const Site& site = Site::current()) const {
    auto bytes = buffer_.element_bytes(index, site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    return reinterpret_cast<T*>(bytes->data());
  }

  Result<std::span<T>> as_span(const Site& site = Site::current()) const {
    return buffer_.template as<T>(site);
  }

  /// @brief First index holding @p value, nullopt when absent.
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
    if (!found->has_value()) return fail(Errc::KeyNotFound, buffer_.storage().address());
    return **found;
  }

  Result<bool> contains(const T& value, const Site& site = Site::current()) const {
    auto found = try_index_of(value, site);
    if (!found) return unmanaged_detail::unexpected<Error>(found.error());
    return found->has_value();
  }

  /// @brief Copy element @p source_index into @p destination at @p destination_index.
  Status copy_element_to(std::size_t source_index, const UnsafeArray& destination,
                         std::size_t destination_index, const Site& site = Site::current()) const {
    return buffer_.copy_element_to(source_index, destination.buffer_, destination_index, site);
  }

  /// @brief Change the length; new slots are zeroed when @p zero_new_slots.
  Status resize(std::size_t new_length, bool zero_new_slots = true,
                const Site& site = Site::current()) {
    return buffer_.resize(new_length, zero_new_slots, site);
  }

  /// @brief Zero every element.
  Status clear(const Site& site = Site::current()) { return buffer_.clear(site); }

private:
  explicit UnsafeArray(UnsafeBuffer&& buffer) noexcept : buffer_(std::move(buffer)) {}

  UnsafeBuffer buffer_{};
};

} // namespace unmanaged::collections
